#pragma once

#include <StormByte/platform.h>

#ifdef WINDOWS
	#ifdef ByteCursor_EXPORTS
		#define BYTECURSOR_PUBLIC	__declspec(dllexport)
	#else
		#define BYTECURSOR_PUBLIC	__declspec(dllimport)
	#endif
	#define BYTECURSOR_PRIVATE
#else
	#define BYTECURSOR_PUBLIC		__attribute__ ((visibility ("default")))
	#define BYTECURSOR_PRIVATE	__attribute__ ((visibility ("hidden")))
#endif
