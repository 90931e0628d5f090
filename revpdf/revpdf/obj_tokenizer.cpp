#include "pch.h"
#include "token.h"

bool IsPdfWhitespace( char c )
{
	return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\0';
}

bool IsPdfDelimiter( char c )
{
	return IsPdfWhitespace( c ) || (c && memchr( "(){}[]<>/%", c, 10 ));
}

static bool IsDigit( char c )
{
	return c >= '0' && c <= '9';
}

static token InnerToken( const char*& p, const char *& /*out*/ tokenStart, char const * end )
{
	for(;;)
	{
		tokenStart = p;
		if( p >= end )
			return token_e::Eof;

		switch( *p )
		{
		case ' ':
		case '\n':
		case '\r':
		case '\t':
		case '\f':
		case '\0':
			++p;
			continue;
		case '%':
			while( p < end && *p != '\n' && *p != '\r' )
				++p;
			continue;
		case '<':
			if( p + 1 < end && p[1] == '<' )
			{
				p += 2;
				return token_e::DictStart;
			}

			tokenStart = ++p;
			while( p < end && *p != '>' )
				++p;
			if( p >= end )
				throw MalformedPdfError( "unterminated hex string", 0 );
			++p;
			return token_e::HexString;

		case '>':
			if( p + 1 < end && p[1] == '>' )
			{
				p += 2;
				return token_e::DictEnd;
			}
			throw MalformedPdfError( "unexpected '>'", 0 );

		case ')':
			throw MalformedPdfError( "unexpected ')'", 0 );

		case '/':
			tokenStart = ++p;
			while( p < end && !IsPdfDelimiter( *p ) )
				++p;
			return token_e::Name;

		case '0':
		case '1':
		case '2':
		case '3':
		case '4':
		case '5':
		case '6':
		case '7':
		case '8':
		case '9':
		case '.':
		case '+':
		case '-':
			{
				bool isReal = *p == '.';
				++p;
				while( p < end && IsDigit( *p ) )
					++p;

				if( !isReal && p < end && *p == '.' )
				{
					isReal = true;
					++p;
					while( p < end && IsDigit( *p ) )
						++p;
				}
				return isReal ? token_e::NumberDouble : token_e::NumberInt;
			}
		case '[':
			++p;
			return token_e::ArrayStart;
		case ']':
			++p;
			return token_e::ArrayEnd;

		case '(':
			tokenStart = ++p;
			{
				int nparens = 1;
				while( nparens )
				{
					if( p >= end )
						throw MalformedPdfError( "unterminated string", 0 );

					switch( *p )
					{
					case '(':
						++nparens;
						break;
					case ')':
						--nparens;
						break;
					case '\\':
						++p;
						break;
					}
					++p;
				}
				return token_e::String;
			}

		case '{':
		case '}':
			++p;
			return token_e::Unknown;

		default:
			while( p < end && !IsPdfDelimiter( *p ) )
				++p;
			return token_e::Keyword;
		}
	}
}

#define MATCH_KEYWORD( k, tok )\
	if (p - start == sizeof(k) - 1)\
		if (memcmp( start, k, sizeof(k) - 1 ) == 0)\
			return tok;

token Token( const char *& p, const char *& start, char const * end )
{
	token t = InnerToken( p, start, end );
	if (t == token_e::Keyword)
	{
		MATCH_KEYWORD( "R", token_e::Ref );
		MATCH_KEYWORD( "obj", token_e::KeywordObj );
		MATCH_KEYWORD( "endobj", token_e::KeywordEndObj );
		MATCH_KEYWORD( "stream", token_e::Stream );
		MATCH_KEYWORD( "endstream", token_e::EndStream );
		MATCH_KEYWORD( "true", token_e::True );
		MATCH_KEYWORD( "false", token_e::False );
		MATCH_KEYWORD( "null", token_e::Null );
		MATCH_KEYWORD( "xref", token_e::Xref );
		MATCH_KEYWORD( "trailer", token_e::Trailer );
		MATCH_KEYWORD( "startxref", token_e::StartXref );
	}

	return t;
}
