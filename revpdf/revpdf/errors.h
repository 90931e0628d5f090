#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

// Base for failures caused by the bytes of a document or by a rewrite.
class PdfError : public std::runtime_error
{
public:
	explicit PdfError( std::string const & what )
		: std::runtime_error( what )
	{
	}
};

// Structural damage found while reading; `offset` is where it was noticed.
class MalformedPdfError : public PdfError
{
public:
	size_t offset;

	MalformedPdfError( std::string const & what, size_t offset )
		: PdfError( what ), offset( offset )
	{
	}
};

// A rewrite would leave a reference pointing nowhere.
class IntegrityError : public PdfError
{
public:
	explicit IntegrityError( std::string const & what )
		: PdfError( what )
	{
	}
};

// The caller broke a contract of the API.
class UsageError : public std::logic_error
{
public:
	explicit UsageError( std::string const & what )
		: std::logic_error( what )
	{
	}
};
