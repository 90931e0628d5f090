#include "pch.h"
#include "token.h"
#include "parse.h"
#include "file_parser.h"

char const * FileParser::At( size_t offset ) const
{
	if( offset >= f.Size() )
		throw MalformedPdfError( "offset lies outside the file", offset );
	return f.F() + offset;
}

static char const * FindBackwards( char const * begin, char const * end, char const * keyword )
{
	size_t len = strlen( keyword );
	if( (size_t)(end - begin) < len )
		return 0;

	for( char const * p = end - len; p >= begin; --p )
	{
		if( !memcmp( p, keyword, len ) )
			return p;
		if( p == begin )
			break;
	}

	return 0;
}

std::string FileParser::HeaderVersion() const
{
	char const * end = f.F() + std::min( f.Size(), (size_t)1024 );

	for( char const * p = f.F(); p + 8 <= end; ++p )
	{
		if( memcmp( p, "%PDF-", 5 ) )
			continue;

		if( p[5] >= '0' && p[5] <= '9' && p[6] == '.' && p[7] >= '0' && p[7] <= '9' )
			return std::string( p + 5, p + 8 );
	}

	return std::string();
}

static char const * GetPdfEof( MappedFile const & f )
{
	char const * begin = f.F() + (f.Size() > 1024 ? f.Size() - 1024 : 0);
	return FindBackwards( begin, f.End(), "%%EOF" );
}

size_t FileParser::StartXref() const
{
	char const * eof = GetPdfEof( f );
	if( !eof )
	{
		DebugOutput( DebugLevel::Info, "no %%%%EOF marker near the end of the file" );
		eof = f.End();
	}

	char const * begin = f.F() + (f.Size() > 1024 ? f.Size() - 1024 : 0);
	char const * startXref = FindBackwards( begin, eof, "startxref" );
	if( !startXref )
		throw MalformedPdfError( "startxref keyword not found", f.Size() );

	char const * p = startXref + 9;
	char const * tokenStart;
	if( Token( p, tokenStart, eof ) != token_e::NumberInt )
		throw MalformedPdfError( "bogus xref offset", (size_t)(startXref - f.F()) );

	long long offset = Number( tokenStart, p ).num;
	if( offset < 0 || (size_t)offset >= f.Size() )
		throw MalformedPdfError( "bogus xref offset", (size_t)(startXref - f.F()) );

	return (size_t)offset;
}

PObject FileParser::ParseObjectAt( size_t offset, ObjectId id, ObjectResolver const * objmap ) const
{
	try
	{
		return ParseIndirect( At( offset ), f.End(), id, objmap );
	}
	catch( MalformedPdfError const & e )
	{
		if( e.offset )
			throw;
		throw MalformedPdfError( e.what(), offset );
	}
}

// The trailer-like part of an xref stream dictionary.
static PDictionary TrailerFromXrefStream( PDictionary const & dict )
{
	PDictionary trailer = CopyDictionary( dict );
	trailer->Remove( "Type" );
	trailer->Remove( "W" );
	trailer->Remove( "Index" );
	trailer->Remove( "Length" );
	trailer->Remove( "Filter" );
	trailer->Remove( "DecodeParms" );
	return trailer;
}

static PStream ReadXrefStreamObject( char const * p, char const * end, ObjectResolver const & objmap )
{
	ObjectId id;
	if( !ParseObjectHeader( p, end, id ) )
		throw MalformedPdfError( "no cross-reference section", 0 );

	PStream stream = boost::dynamic_pointer_cast<Stream>( ParseDirect( p, end, &objmap ) );
	if( !stream || GetTypeName( stream ) != "XRef" )
		throw MalformedPdfError( "object is not a cross-reference stream", 0 );

	return stream;
}

static void ReadXrefStreamSection( PStream const & stream, XrefSection & section, ObjectResolver const & objmap )
{
	std::string data;
	if( !stream->GetStreamBytes( objmap, data ) )
		throw MalformedPdfError( "cross-reference stream data can't be decoded", 0 );

	section.ReadXrefStream( *stream->dict, data, objmap );
}

PRevision FileParser::ReadRevisionAt( size_t offset, ObjectResolver const & objmap ) const
{
	try
	{
		char const * xref = At( offset );
		char const * p = xref;
		char const * tokenStart;

		if( Token( p, tokenStart, f.End() ) == token_e::Xref )
		{
			PRevision revision( new Revision( PDictionary( new Dictionary() ), offset ) );
			p = revision->xref.ReadXrefSection( xref, f.End() );

			PDictionary trailer = boost::dynamic_pointer_cast<Dictionary>( Parse( p, f.End() ) );
			if( !trailer )
				throw MalformedPdfError( "invalid trailer dictionary", 0 );
			revision->trailer = trailer;

			PObject xrefStm = trailer->Get( "XRefStm" );
			if( xrefStm && xrefStm->Type() == ObjectType::Number )
			{
				size_t stmOffset = (size_t)((Number *)xrefStm.get())->num;
				try
				{
					XrefSection stmSection;
					ReadXrefStreamSection( ReadXrefStreamObject( At( stmOffset ), f.End(), objmap ), stmSection, objmap );
					revision->xref.merge( stmSection );
				}
				catch( MalformedPdfError const & e )
				{
					DebugOutput( DebugLevel::Warning, "ignoring /XRefStm at %zu: %s", stmOffset, e.what() );
				}
			}

			return revision;
		}

		PStream stream = ReadXrefStreamObject( xref, f.End(), objmap );
		PRevision revision( new Revision( TrailerFromXrefStream( stream->dict ), offset ) );
		ReadXrefStreamSection( stream, revision->xref, objmap );
		return revision;
	}
	catch( MalformedPdfError const & e )
	{
		if( e.offset )
			throw;
		throw MalformedPdfError( e.what(), offset );
	}
}

static bool AtLineStart( char const * begin, char const * p )
{
	return p == begin || p[-1] == '\n' || p[-1] == '\r';
}

PRevision FileParser::Reconstruct() const
{
	std::map<unsigned, std::pair<unsigned, size_t> > found;	// last occurrence wins
	PDictionary trailer;

	char const * begin = f.F();
	char const * end = f.End();

	for( char const * p = begin; p < end; ++p )
	{
		if( !AtLineStart( begin, p ) )
			continue;

		char const * q = p;
		while( q < end && (*q == ' ' || *q == '\t') )
			++q;

		if( q < end && *q >= '0' && *q <= '9' )
		{
			char const * r = q;
			ObjectId id;
			if( ParseObjectHeader( r, end, id ) && id.num != 0 )
				found[ id.num ] = std::make_pair( id.gen, (size_t)(q - begin) );
		}
		else if( end - q >= 7 && !memcmp( q, "trailer", 7 ) )
		{
			char const * r = q + 7;
			try
			{
				PDictionary dict = boost::dynamic_pointer_cast<Dictionary>( Parse( r, end ) );
				if( dict )
					trailer = dict;
			}
			catch( MalformedPdfError const & e )
			{
				DebugOutput( DebugLevel::Info, "unreadable trailer at %zu: %s", (size_t)(q - begin), e.what() );
			}
		}
	}

	PRevision revision( new Revision( PDictionary( new Dictionary() ) ) );
	for( std::map<unsigned, std::pair<unsigned, size_t> >::const_iterator it = found.begin(); it != found.end(); ++it )
		revision->xref.addInUse( it->first, it->second.first, it->second.second );

	if( !trailer )
	{
		// without a trailer keyword, use the last xref stream or the catalog
		size_t lastPos = 0;
		ObjectId catalog;

		for( std::map<unsigned, std::pair<unsigned, size_t> >::const_iterator it = found.begin(); it != found.end(); ++it )
		{
			PObject value;
			try
			{
				value = ParseObjectAt( it->second.second, ObjectId( it->first, it->second.first ), 0 );
			}
			catch( MalformedPdfError const & e )
			{
				DebugOutput( DebugLevel::Info, "skipping object %u: %s", it->first, e.what() );
				continue;
			}

			std::string type = GetTypeName( value );
			if( type == "XRef" && it->second.second >= lastPos )
			{
				trailer = TrailerFromXrefStream( GetDictionary( value ) );
				lastPos = it->second.second;
			}
			else if( type == "Catalog" )
				catalog = ObjectId( it->first, it->second.first );
		}

		if( !trailer )
		{
			trailer.reset( new Dictionary() );
			if( catalog.num )
				trailer->Add( "Root", PIndirect( new Indirect( catalog ) ) );
		}
	}
	else
		trailer = CopyDictionary( trailer );

	trailer->Remove( "Prev" );
	trailer->Remove( "XRefStm" );
	trailer->Add( "Size", PNumber( new Number( (long long)revision->xref.maxNum() + 1 ) ) );
	revision->trailer = trailer;

	if( !trailer->Has( "Root" ) )
		DebugOutput( DebugLevel::Warning, "reconstructed document has no catalog" );

	return revision;
}
