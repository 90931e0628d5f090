#include "pch.h"
#include "token.h"
#include "parse.h"
#include "serializer.h"
#include "object_stream.h"

static void ReadHeader( std::string const & data, size_t count, size_t first, std::vector< std::pair<unsigned, size_t> > & members )
{
	char const * p = data.data();
	char const * end = p + std::min( first, data.size() );
	char const * tokenStart;

	for( size_t i = 0; i < count; i++ )
	{
		if( Token( p, tokenStart, end ) != token_e::NumberInt )
			throw MalformedPdfError( "bad object stream header", 0 );
		long long num = Number( tokenStart, p ).num;

		if( Token( p, tokenStart, end ) != token_e::NumberInt )
			throw MalformedPdfError( "bad object stream header", 0 );
		long long offset = Number( tokenStart, p ).num;

		if( num <= 0 || offset < 0 )
			throw MalformedPdfError( "bad object stream header", 0 );

		members.push_back( std::make_pair( (unsigned)num, (size_t)offset ) );
	}
}

static void GetCountAndFirst( Stream const & stream, ObjectResolver const & objmap, size_t & count, size_t & first )
{
	PNumber n = stream.dict->Get<Number>( "N", objmap );
	PNumber f = stream.dict->Get<Number>( "First", objmap );
	if( !n || !f || n->num < 0 || f->num < 0 )
		throw MalformedPdfError( "object stream without valid /N and /First", 0 );

	count = (size_t)n->num;
	first = (size_t)f->num;
}

void ObjectStream::Load( Stream const & stream, ObjectResolver const & objmap )
{
	size_t count;
	GetCountAndFirst( stream, objmap, count, first );

	if( !stream.GetStreamBytes( objmap, data ) )
		throw MalformedPdfError( "object stream data can't be decoded", 0 );

	members.clear();
	ReadHeader( data, count, first, members );
}

PObject ObjectStream::ParseMember( size_t index ) const
{
	size_t offset = first + members.at( index ).second;
	if( offset >= data.size() )
		throw MalformedPdfError( "object stream member lies outside the data", 0 );

	char const * p = data.data() + offset;
	return Parse( p, data.data() + data.size() );
}

void ObjectStream::ReadMemberNumbers( Stream const & stream, ObjectResolver const & objmap, std::vector<unsigned> & out )
{
	ObjectStream table;
	table.Load( stream, objmap );

	for( size_t i = 0; i < table.members.size(); i++ )
		out.push_back( table.members[i].first );
}

void ObjectStream::Pack( Stream & stream, std::vector<PIndirectObject> const & members )
{
	std::string header, body;
	char sz[32];

	for( std::vector<PIndirectObject>::const_iterator it = members.begin(); it != members.end(); ++it )
	{
		IndirectObject const & obj = **it;
		if( obj.IsFree() || obj.value->Type() == ObjectType::Stream || obj.id.gen != 0 )
			throw UsageError( "object can't be stored in an object stream" );

		snprintf( sz, sizeof( sz ), "%u %u ", obj.id.num, (unsigned)body.size() );
		header += sz;
		Serialize( obj.value, body );
		body += ' ';
	}

	stream.dict->Add( "Type", PName( new Name( String( "ObjStm" ) ) ) );
	stream.dict->Add( "N", PNumber( new Number( (long long)members.size() ) ) );
	stream.dict->Add( "First", PNumber( new Number( (long long)header.size() ) ) );
	stream.SetStreamBytes( header + body, true );
}

bool CanPackIntoObjectStream( PIndirectObject const & obj, PDictionary const & trailer,
	DocumentConfig const & config )
{
	if( !obj || obj->IsFree() || !obj->IsIndirect() || obj->id.gen != 0 )
		return false;

	if( obj->value->Type() == ObjectType::Stream || obj->value->Type() == ObjectType::Null )
		return false;

	std::string type = GetTypeName( obj->value );
	if( config.objectStreamExclusions.count( type ) )
		return false;

	PObject encrypt = trailer ? trailer->Get( "Encrypt" ) : PObject();
	if( encrypt )
	{
		if( encrypt == obj )
			return false;
		if( encrypt->Type() == ObjectType::Ref && ((Indirect *)encrypt.get())->Id() == obj->id )
			return false;
		if( type == "Catalog" )
			return false;
	}

	return true;
}
