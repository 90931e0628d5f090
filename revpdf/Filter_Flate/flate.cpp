#include <cstdlib>
#include <zlib.h>
#include "flate.h"

#define CHECK_ERR(err, buf, alloc) \
	{ \
		if (err != Z_OK) { \
			if (buf) alloc( buf, 0 ); \
			return NULL; \
		} \
	}

char* Inflate( const char* inputStart, const char* inputEnd, size_t* length, void* (*alloc)( void*, size_t ) )
{
	int err;

	z_stream d_stream;
	d_stream.zalloc = (alloc_func)0;
	d_stream.zfree = (free_func)0;
	d_stream.opaque = (voidpf)0;

	d_stream.next_in = (unsigned char*)inputStart;
	d_stream.avail_in = (uInt)(inputEnd - inputStart);

	err = inflateInit( &d_stream );
	unsigned char* buf = NULL;
	CHECK_ERR(err, buf, alloc);

	size_t bufFilled = 0;
	size_t bufSize = 4096;
	buf = (unsigned char*)alloc( NULL, bufSize );
	for(;;)
	{
		d_stream.next_out = buf + bufFilled;
		d_stream.avail_out = (uInt)(bufSize - bufFilled);
		err = inflate( &d_stream, Z_NO_FLUSH );

		bufFilled = d_stream.next_out - buf;

		if( err == Z_STREAM_END )
			break;

		// truncated input: keep what was inflated so far
		if( err == Z_BUF_ERROR && d_stream.avail_in == 0 )
			break;

		if( err != Z_OK )
		{
			inflateEnd( &d_stream );
			alloc( buf, 0 );
			return NULL;
		}

		if( d_stream.avail_out == 0 )
		{
			bufSize *= 4;
			buf = (unsigned char*)alloc( buf, bufSize );
		}
	}

	err = inflateEnd( &d_stream );
	CHECK_ERR(err, buf, alloc);

	*length = bufFilled;
	return (char*)buf;
}

char* Deflate( const char* inputStart, const char* inputEnd, size_t* length, void* (*alloc)( void*, size_t ) )
{
	uLong sourceLen = (uLong)(inputEnd - inputStart);
	uLongf bufSize = compressBound( sourceLen );

	unsigned char* buf = (unsigned char*)alloc( NULL, bufSize ? bufSize : 1 );
	int err = compress2( buf, &bufSize, (const Bytef*)inputStart, sourceLen, Z_DEFAULT_COMPRESSION );
	CHECK_ERR(err, buf, alloc);

	*length = bufSize;
	return (char*)buf;
}
