#include "pch.h"
#include "token.h"

bool XrefSection::insert( Xref const & xref, bool strict )
{
	if( entries.find( xref.num ) != entries.end() )
	{
		if( strict )
		{
			char sz[96];
			snprintf( sz, sizeof( sz ), "object %u already has an entry in this cross-reference section", xref.num );
			throw UsageError( sz );
		}
		return false;
	}

	entries.insert( std::make_pair( xref.num, xref ) );
	return true;
}

void XrefSection::addInUse( unsigned num, unsigned generation, size_t pos )
{
	insert( Xref( Xref::InUse, num, generation, pos, 0 ), true );
}

void XrefSection::addFree( unsigned num, unsigned generation )
{
	insert( Xref( Xref::Free, num, generation, 0, 0 ), true );
}

void XrefSection::addCompressed( unsigned num, unsigned stream, size_t index )
{
	insert( Xref( Xref::Compressed, num, 0, index, stream ), true );
}

void XrefSection::merge( XrefSection const & other )
{
	for( const_iterator it = other.begin(); it != other.end(); ++it )
		insert( it->second, false );
}

static size_t ReadNumberToken( char const *& p, char const * end )
{
	char const * tokenStart;
	if( Token( p, tokenStart, end ) != token_e::NumberInt )
		throw MalformedPdfError( "bad cross-reference entry", 0 );
	return (size_t)Number( tokenStart, p ).num;
}

char const * XrefSection::ReadXrefSection( char const * p, char const * end )
{
	char const * tokenStart;
	if( Token( p, tokenStart, end ) != token_e::Xref )
		throw MalformedPdfError( "expected xref keyword", 0 );

	for(;;)
	{
		char const * q = p;
		token t = Token( q, tokenStart, end );

		if( t == token_e::Trailer )
			return q;

		if( t != token_e::NumberInt )
			throw MalformedPdfError( "bad cross-reference subsection header", 0 );

		size_t first = (size_t)Number( tokenStart, q ).num;
		size_t count = ReadNumberToken( q, end );
		p = q;

		for( size_t n = first; n < first + count; n++ )
		{
			size_t fileOffset = ReadNumberToken( p, end );
			size_t generation = ReadNumberToken( p, end );

			if( Token( p, tokenStart, end ) != token_e::Keyword || p - tokenStart != 1 )
				throw MalformedPdfError( "bad cross-reference entry type", 0 );

			bool isFree = *tokenStart == 'f';
			if( !isFree && *tokenStart != 'n' )
				throw MalformedPdfError( "bad cross-reference entry type", 0 );

			Xref xref( isFree ? Xref::Free : Xref::InUse, (unsigned)n, (unsigned)generation,
				isFree ? 0 : fileOffset, 0 );

			// an in-use entry pointing at offset 0 is how some writers spell "free"
			if( !isFree && fileOffset == 0 )
				xref.kind = Xref::Free;

			if( !insert( xref, false ) )
				DebugOutput( DebugLevel::Info, "duplicate cross-reference entry for object %u ignored", (unsigned)n );
			else if( isFree )
				nextFree[ (unsigned)n ] = (unsigned)fileOffset;
		}
	}
}

static unsigned long long ReadXrefStrNum( int size, const char*& stream, const char* streamEnd )
{
	if( stream + size > streamEnd )
		throw MalformedPdfError( "cross-reference stream data too short", 0 );

	unsigned long long ret = 0;

	for( int i = 0 ; i < size ; i++ )
		ret = (ret << 8u) + (unsigned)(unsigned char)*stream++;

	return ret;
}

void XrefSection::ReadXrefStream( Dictionary const & xrefDict, std::string const & data, ObjectResolver const & objmap )
{
	const char* streamContent = data.data();
	const char* streamEnd = streamContent + data.size();

	PNumber size = xrefDict.Get<Number>( "Size", objmap );
	if( !size )
		throw MalformedPdfError( "cross-reference stream without /Size", 0 );
	PArray index = xrefDict.Get<Array>( "Index", objmap );

	typedef std::vector<std::pair<size_t, size_t> > blocks_t;
	blocks_t streamBlocks;

	if( !index )
		streamBlocks.push_back( std::pair< size_t, size_t >( 0, (size_t)size->num ) );
	else
	{
		for( size_t i = 0; i + 1 < index->elements.size(); i += 2 )
		{
			PNumber start = Object::ResolveIndirect_<Number>( index->elements[i], objmap );
			PNumber num = Object::ResolveIndirect_<Number>( index->elements[i + 1], objmap );
			if( !start || !num || start->num < 0 || num->num < 0 )
				throw MalformedPdfError( "bad /Index in cross-reference stream", 0 );
			streamBlocks.push_back( std::pair< size_t, size_t >( (size_t)start->num, (size_t)num->num ) );
		}
	}

	PArray fieldSizes = xrefDict.Get<Array>( "W", objmap );
	if( !fieldSizes || fieldSizes->elements.size() < 3 )
		throw MalformedPdfError( "bad /W in cross-reference stream", 0 );

	int widths[3];
	for( int i = 0; i < 3; i++ )
	{
		PNumber w = Object::ResolveIndirect_<Number>( fieldSizes->elements[i], objmap );
		if( !w || w->num < 0 || w->num > 8 )
			throw MalformedPdfError( "bad /W in cross-reference stream", 0 );
		widths[i] = (int)w->num;
	}

	for( blocks_t::const_iterator n = streamBlocks.begin() ; n != streamBlocks.end() ; n++ )
	{
		for( size_t x = 0 ; x < n->second ; x++ )
		{
			unsigned num = (unsigned)(n->first + x);
			unsigned long long type = (widths[0] == 0) ? 1 : ReadXrefStrNum( widths[0], streamContent, streamEnd );
			unsigned long long f2 = (widths[1] == 0) ? 0 : ReadXrefStrNum( widths[1], streamContent, streamEnd );
			unsigned long long f3 = (widths[2] == 0) ? 0 : ReadXrefStrNum( widths[2], streamContent, streamEnd );

			switch( type )
			{
			case 0:
				if( insert( Xref( Xref::Free, num, (unsigned)f3, 0, 0 ), false ) )
					nextFree[ num ] = (unsigned)f2;
				break;
			case 1:
				insert( Xref( Xref::InUse, num, (unsigned)f3, (size_t)f2, 0 ), false );
				break;
			case 2:
				insert( Xref( Xref::Compressed, num, 0, (size_t)f3, (unsigned)f2 ), false );
				break;
			default:
				// unknown types are references to the null object
				break;
			}
		}
	}
}

void XrefSection::BuildFreeList( std::vector<unsigned> & order ) const
{
	std::set<unsigned> seen;
	seen.insert( 0 );

	// follow the links as read, as long as they stay on free entries
	std::map<unsigned, unsigned>::const_iterator link = nextFree.find( 0 );
	while( link != nextFree.end() && !seen.count( link->second ) )
	{
		const Xref* xref = find( link->second );
		if( !xref || !xref->IsFree() )
			break;

		order.push_back( link->second );
		seen.insert( link->second );
		link = nextFree.find( link->second );
	}

	// entries the links did not reach are appended in ascending order
	for( const_iterator it = entries.begin(); it != entries.end(); ++it )
		if( it->second.IsFree() && !seen.count( it->first ) )
		{
			order.push_back( it->first );
			seen.insert( it->first );
		}
}

void XrefSection::WriteTable( std::string & out ) const
{
	std::vector<unsigned> freeOrder;
	BuildFreeList( freeOrder );

	std::map<unsigned, unsigned> links;
	unsigned prev = 0;
	for( std::vector<unsigned>::const_iterator it = freeOrder.begin(); it != freeOrder.end(); ++it )
	{
		links[prev] = *it;
		prev = *it;
	}
	links[prev] = 0;

	out += "xref\n";

	char sz[32];
	const_iterator it = entries.begin();
	while( it != entries.end() )
	{
		const_iterator last = it;
		size_t count = 1;
		for( const_iterator next = it; ++next != entries.end() && next->first == last->first + 1; last = next )
			++count;

		snprintf( sz, sizeof( sz ), "%u %u\n", it->first, (unsigned)count );
		out += sz;

		for( size_t i = 0; i < count; i++, ++it )
		{
			Xref const & xref = it->second;
			if( xref.IsInUse() )
				snprintf( sz, sizeof( sz ), "%010llu %05u n \n", (unsigned long long)xref.pos, xref.generation );
			else if( xref.IsFree() )
				snprintf( sz, sizeof( sz ), "%010u %05u f \n", links.count( xref.num ) ? links[xref.num] : 0, xref.generation );
			else
				throw UsageError( "compressed entries need a cross-reference stream" );
			out += sz;
		}
	}
}

static int BytesNeeded( unsigned long long value )
{
	int n = 1;
	while( value >>= 8 )
		++n;
	return n;
}

static void AppendBigEndian( std::string & data, unsigned long long value, int width )
{
	for( int i = width - 1; i >= 0; i-- )
		data += (char)((value >> (8 * i)) & 0xff);
}

void XrefSection::WriteStream( std::string & data, PArray & index, PArray & w ) const
{
	unsigned long long max2 = 0, max3 = 0;
	for( const_iterator it = entries.begin(); it != entries.end(); ++it )
	{
		Xref const & xref = it->second;
		unsigned long long f2 = xref.IsInUse() ? xref.pos : xref.IsCompressed() ? xref.stream : 0;
		unsigned long long f3 = xref.IsCompressed() ? xref.pos : xref.generation;
		if( f2 > max2 ) max2 = f2;
		if( f3 > max3 ) max3 = f3;
	}

	int w2 = BytesNeeded( max2 );
	int w3 = BytesNeeded( max3 );

	w.reset( new Array() );
	w->Add( PNumber( new Number( 1 ) ) );
	w->Add( PNumber( new Number( w2 ) ) );
	w->Add( PNumber( new Number( w3 ) ) );

	index.reset( new Array() );

	const_iterator it = entries.begin();
	while( it != entries.end() )
	{
		unsigned first = it->first;
		unsigned count = 0;
		do
		{
			Xref const & xref = it->second;
			switch( xref.kind )
			{
			case Xref::Free:
				AppendBigEndian( data, 0, 1 );
				AppendBigEndian( data, 0, w2 );
				AppendBigEndian( data, xref.generation, w3 );
				break;
			case Xref::InUse:
				AppendBigEndian( data, 1, 1 );
				AppendBigEndian( data, xref.pos, w2 );
				AppendBigEndian( data, xref.generation, w3 );
				break;
			case Xref::Compressed:
				AppendBigEndian( data, 2, 1 );
				AppendBigEndian( data, xref.stream, w2 );
				AppendBigEndian( data, xref.pos, w3 );
				break;
			}
			++count;
			++it;
		} while( it != entries.end() && it->first == first + count );

		index->Add( PNumber( new Number( first ) ) );
		index->Add( PNumber( new Number( count ) ) );
	}
}
