#pragma once

#include <cstddef>

	extern "C"
	char* Inflate( const char* inputStart, const char* inputEnd, size_t* length, void* (*alloc)( void*, size_t ) );

	extern "C"
	char* Deflate( const char* inputStart, const char* inputEnd, size_t* length, void* (*alloc)( void*, size_t ) );
