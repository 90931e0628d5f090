#include "pch.h"
#include "token.h"
#include "parse.h"

static int HexValue( char c )
{
	if (c >= '0' && c <= '9') return c - '0';
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	if (c >= 'A' && c <= 'F') return c - 'A' + 10;
	return -1;
}

// arrays and dictionaries nested deeper than this are rejected
static const size_t MaxNesting = 512;

PObject Parse( const char*& p, char const * end, size_t depth )
{
	const char* tokenStart = 0;
	token t = Token( p, tokenStart, end );
	switch( t )
	{
	case token_e::DictStart:
		return ParseDict( p, end, depth + 1 );
	case token_e::NumberInt:
		{
			Number ret( tokenStart, p );
			const char* lookahead = p;
			if( Token( lookahead, tokenStart, end ) == token_e::NumberInt )
			{
				Number generation( tokenStart, lookahead );
				if( Token( lookahead, tokenStart, end ) == token_e::Ref )
				{
					if( ret.num < 0 || generation.num < 0 )
						throw MalformedPdfError( "negative number in object reference", 0 );
					p = lookahead;
					return PObject( new Indirect( ret, generation ) );
				}
			}
			return PObject( new Number( ret ) );
		}
	case token_e::ArrayStart:
		return ParseArray( p, end, depth + 1 );

	case token_e::HexString:
		return PString( new String( DecodeHexString( tokenStart, p - 1 ) ) );

	case token_e::String:
		return PString( new String( UnescapeString( tokenStart, p - 1 ) ) );

	case token_e::True:
		return PBool( new Bool( true ) );
	case token_e::False:
		return PBool( new Bool( false ) );
	case token_e::Null:
		return PNull( new Null() );

	case token_e::Name:
		return PName( new Name( String( DecodeName( tokenStart, p ) ) ) );

	case token_e::NumberDouble:
		return PDouble( new Double( tokenStart, p ) );

	case token_e::Eof:
		throw MalformedPdfError( "unexpected end of data", 0 );

	default:
		throw MalformedPdfError( "unexpected token '" + std::string( tokenStart, p ) + "'", 0 );
	}
}

PDictionary ParseDict( const char*& p, char const * end, size_t depth )
{
	if( depth > MaxNesting )
		throw MalformedPdfError( "objects nested too deeply", 0 );

	PDictionary dict( new Dictionary() );
	const char* tokenStart = 0;
	for(;;)
	{
		token t = Token( p, tokenStart, end );
		switch( t )
		{
		case token_e::Name:
			{
				Name name = String( DecodeName( tokenStart, p ) );
				PObject value = Parse( p, end, depth );

				// a null value is the same as an absent key
				if( value->Type() != ObjectType::Null )
					dict->Add( name, value );
				break;
			}
		case token_e::DictEnd:
			return dict;
		default:
			throw MalformedPdfError( "dictionary key is not a name", 0 );
		}
	}
}

PArray ParseArray( const char*& p, char const * end, size_t depth )
{
	if( depth > MaxNesting )
		throw MalformedPdfError( "objects nested too deeply", 0 );

	PArray array( new Array() );

	for(;;)
	{
		char const * q = p;
		const char* tokenStart = 0;
		if( Token( p, tokenStart, end ) == token_e::ArrayEnd )
			return array;
		p = q;
		array->Add( Parse( p, end, depth ) );
	}
}

std::string UnescapeString( char const * src, char const * srcend )
{
	std::string dest;
	dest.reserve( srcend - src );

	while( src < srcend )
	{
		if (*src == '\\' && src + 1 < srcend)
		{
			++src;
			switch( *src )
			{
			case 'n': dest += '\n'; break;
			case 'r': dest += '\r'; break;
			case 't': dest += '\t'; break;
			case 'b': dest += '\b'; break;
			case 'f': dest += '\f'; break;
			case '(': dest += '('; break;
			case ')': dest += ')'; break;
			case '\\': dest += '\\'; break;
			case '\r':
				// line continuation
				if (src + 1 < srcend && src[1] == '\n')
					++src;
				break;
			case '\n':
				break;
			case '0':
			case '1':
			case '2':
			case '3':
			case '4':
			case '5':
			case '6':
			case '7':
				{
					int value = 0;
					int digits = 0;
					while( digits < 3 && src < srcend && *src >= '0' && *src <= '7' )
					{
						value = value * 8 + (*src++ - '0');
						++digits;
					}
					dest += (char)(value & 0xff);
					--src;
				}
				break;
			default:
				dest += *src;
			}
		}
		else if (*src == '\r')
		{
			// unescaped end-of-line markers all read as LF
			dest += '\n';
			if (src + 1 < srcend && src[1] == '\n')
				++src;
		}
		else
			dest += *src;

		++src;
	}

	return dest;
}

std::string DecodeHexString( char const * src, char const * srcend )
{
	std::string dest;
	int high = -1;

	for( ; src < srcend; ++src )
	{
		int v = HexValue( *src );
		if (v < 0)
			continue;

		if (high < 0)
			high = v;
		else
		{
			dest += (char)(high * 16 + v);
			high = -1;
		}
	}

	// odd digit count: the missing digit is 0
	if (high >= 0)
		dest += (char)(high * 16);

	return dest;
}

std::string DecodeName( char const * src, char const * srcend )
{
	std::string dest;
	dest.reserve( srcend - src );

	while( src < srcend )
	{
		if (*src == '#' && src + 2 < srcend && HexValue( src[1] ) >= 0 && HexValue( src[2] ) >= 0)
		{
			dest += (char)(HexValue( src[1] ) * 16 + HexValue( src[2] ));
			src += 3;
		}
		else
			dest += *src++;
	}

	return dest;
}

static char const * FindKeyword( char const * p, char const * end, char const * keyword )
{
	size_t len = strlen( keyword );
	for( ; p + len <= end; ++p )
		if (*p == *keyword && memcmp( p, keyword, len ) == 0)
			return p;
	return 0;
}

static long long StreamLength( PDictionary const & dict, const ObjectResolver* objmap )
{
	PObject length = dict->Get( "Length" );
	if (length && objmap)
		length = Object::ResolveIndirect_( length, *objmap );
	else if (length && length->Type() == ObjectType::IndirectObject)
		length = ((IndirectObject *)length.get())->value;

	if (!length || length->Type() != ObjectType::Number)
		return -1;

	return ((Number *)length.get())->num;
}

PObject ParseDirect( const char*& p, char const * end, const ObjectResolver* objmap )
{
	PObject o = Parse( p, end );

	char const * tokenStart;
	char const * q = p;
	token t = Token( q, tokenStart, end );

	if ( t == token_e::KeywordEndObj )
	{
		p = q;
		return o;
	}
	else if ( t == token_e::Stream && o->Type() == ObjectType::Dictionary )
	{
		p = q;
		if( p < end && *p == '\r' )
			++p;
		if( p < end && *p == '\n' )
			++p;

		PDictionary dict = boost::static_pointer_cast<Dictionary>( o );
		long long length = StreamLength( dict, objmap );

		char const * dataStart = p;
		char const * dataEnd = 0;

		if( length >= 0 && length <= end - dataStart )
		{
			char const * r = dataStart + length;
			if( Token( r, tokenStart, end ) == token_e::EndStream )
			{
				dataEnd = dataStart + length;
				p = r;
			}
		}

		if( !dataEnd )
		{
			// /Length is missing or wrong: the data runs up to "endstream"
			char const * es = FindKeyword( dataStart, end, "endstream" );
			if( !es )
				throw MalformedPdfError( "stream without endstream", 0 );

			DebugOutput( DebugLevel::Info, "stream /Length is invalid, using endstream keyword" );
			dataEnd = es;
			if( dataEnd > dataStart && dataEnd[-1] == '\n' )
				--dataEnd;
			if( dataEnd > dataStart && dataEnd[-1] == '\r' )
				--dataEnd;
			p = es + 9;
		}

		PStream ret( new Stream( dict, std::string( dataStart, dataEnd ) ) );

		q = p;
		if( token_e::KeywordEndObj == Token( q, tokenStart, end ) )
			p = q;

		return ret;
	}

	// a missing endobj is tolerated; the value is complete
	DebugOutput( DebugLevel::Trace, "object not followed by endobj" );
	return o;
}

bool ParseObjectHeader( const char*& p, char const * end, ObjectId & id )
{
	char const * q = p;
	char const * tokenStart;

	if (Token( q, tokenStart, end ) != token_e::NumberInt)
		return false;
	Number num( tokenStart, q );

	if (Token( q, tokenStart, end ) != token_e::NumberInt)
		return false;
	Number gen( tokenStart, q );

	if (Token( q, tokenStart, end ) != token_e::KeywordObj)
		return false;

	if (num.num < 0 || gen.num < 0)
		return false;

	id = ObjectId( (unsigned)num.num, (unsigned)gen.num );
	p = q;
	return true;
}

PObject ParseIndirect( const char* p, char const * end, ObjectId expected, const ObjectResolver* objmap )
{
	ObjectId found;
	if (!ParseObjectHeader( p, end, found ))
		throw MalformedPdfError( "no object header", 0 );

	if (found != expected)
		throw MalformedPdfError( "object header does not match the cross-reference entry", 0 );

	return ParseDirect( p, end, objmap );
}
