#pragma once

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <boost/noncopyable.hpp>

class MappedFile : boost::noncopyable
{
	int fd;
	void * mapping;
	char const * f;
	size_t size;
	std::string buffer;

public:
	explicit MappedFile( char const * filename )
		: fd( -1 ), mapping( MAP_FAILED ), f( 0 ), size( 0 )
	{
		fd = ::open( filename, O_RDONLY );
		if (fd == -1)
			return;

		struct stat st;
		if (::fstat( fd, &st ) != 0 || st.st_size == 0)
			return;

		size = (size_t)st.st_size;

		mapping = ::mmap( 0, size, PROT_READ, MAP_PRIVATE, fd, 0 );
		if (mapping == MAP_FAILED)
			return;

		f = (char const *)mapping;
	}

	// Keeps a private copy of `bytes`.
	explicit MappedFile( std::string const & bytes )
		: fd( -1 ), mapping( MAP_FAILED ), f( 0 ), size( bytes.size() ), buffer( bytes )
	{
		f = buffer.data();
	}

	bool IsValid() const
	{
		return f != 0 && size != 0;
	}

	char const * F() const
	{
		return f;
	}

	char const * End() const
	{
		return f + size;
	}

	size_t Size() const
	{
		return size;
	}

	~MappedFile()
	{
		if (mapping != MAP_FAILED)
			::munmap( mapping, size );
		if (fd != -1)
			::close( fd );
	}
};
