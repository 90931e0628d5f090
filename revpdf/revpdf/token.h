#pragma once

namespace token_e
{
enum token_e
{
	NumberInt,
	NumberDouble,
	KeywordObj,
	KeywordEndObj,
	Null,
	Stream,
	EndStream,
	Xref,
	Trailer,
	StartXref,
	DictStart,
	DictEnd,
	ArrayStart,
	ArrayEnd,
	Name,
	True,
	False,
	String,
	Ref,
	Unknown,
	HexString,
	Keyword,
	Eof,
};
}
typedef token_e::token_e token;

// Reads one token from [p, end) and advances p past it. `start` receives the
// first byte of the token; for Name it is the byte after '/', for String and
// HexString the byte after the opening delimiter, and the content then ends at
// p - 1. Throws MalformedPdfError on unterminated strings or a stray '>' or ')'.
extern token Token( const char*& p, const char *& start, char const * end );

bool IsPdfWhitespace( char c );
bool IsPdfDelimiter( char c );
