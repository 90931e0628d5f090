#include "pch.h"

Number::Number( const char* start, const char* end )
{
	std::string s( start, end );
	num = strtoll( s.c_str(), 0, 10 );
}

Double::Double( char const * start, char const * end )
{
	std::string s( start, end );
	num = strtod( s.c_str(), 0 );
}

void Dictionary::Add( const Name& key, const PObject& value )
{
	if( !value )
		throw UsageError( "Dictionary::Add: null value for /" + key.str.value );

	dict[ key.str ] = value;
}

PObject Object::ResolveIndirect_( PObject p, ObjectResolver const & t )
{
	if (!p)
		return p;

	if (p->Type() == ObjectType::Ref)
	{
		PIndirectObject o = t.Resolve( ((Indirect *)p.get())->Id() );
		return o ? o->value : PObject();
	}

	if (p->Type() == ObjectType::IndirectObject)
		return ((IndirectObject *)p.get())->value;

	return p;
}

PDictionary GetDictionary( PObject const & value )
{
	if (!value)
		return PDictionary();
	if (value->Type() == ObjectType::Dictionary)
		return boost::static_pointer_cast<Dictionary>( value );
	if (value->Type() == ObjectType::Stream)
		return boost::static_pointer_cast<Stream>( value )->dict;
	return PDictionary();
}

std::string GetTypeName( PObject const & value )
{
	PDictionary dict = GetDictionary( value );
	if (!dict)
		return std::string();

	PObject type = dict->Get( "Type" );
	if (type && type->Type() == ObjectType::IndirectObject)
		type = ((IndirectObject *)type.get())->value;

	if (!type || type->Type() != ObjectType::Name)
		return std::string();

	return ((Name *)type.get())->str.value;
}

static bool ArraysEqual( Array const & a, Array const & b )
{
	if (a.elements.size() != b.elements.size())
		return false;

	for( size_t i = 0; i < a.elements.size(); i++ )
		if (!ObjectsEqual( a.elements[i], b.elements[i] ))
			return false;

	return true;
}

static bool DictionariesEqual( Dictionary const & a, Dictionary const & b )
{
	if (a.Size() != b.Size())
		return false;

	Dictionary::const_iterator i = a.begin(), j = b.begin();
	for( ; i != a.end(); ++i, ++j )
		if (i->first != j->first || !ObjectsEqual( i->second, j->second ))
			return false;

	return true;
}

bool ObjectsEqual( PObject const & a, PObject const & b )
{
	if (a == b)
		return true;
	if (!a || !b)
		return false;

	ObjectType::ObjectType ta = a->Type(), tb = b->Type();

	// integers and reals with the same value are the same PDF number
	if ((ta == ObjectType::Number || ta == ObjectType::Double) &&
		(tb == ObjectType::Number || tb == ObjectType::Double))
		return ToNumber( a ) == ToNumber( b );

	if (ta != tb)
		return false;

	switch( ta )
	{
	case ObjectType::Null:
		return true;
	case ObjectType::Bool:
		return ((Bool *)a.get())->value == ((Bool *)b.get())->value;
	case ObjectType::String:
		return *(String *)a.get() == *(String *)b.get();
	case ObjectType::Name:
		return ((Name *)a.get())->str == ((Name *)b.get())->str;
	case ObjectType::Array:
		return ArraysEqual( *(Array *)a.get(), *(Array *)b.get() );
	case ObjectType::Dictionary:
		return DictionariesEqual( *(Dictionary *)a.get(), *(Dictionary *)b.get() );
	case ObjectType::Ref:
		return ((Indirect *)a.get())->Id() == ((Indirect *)b.get())->Id();
	case ObjectType::IndirectObject:
		return ((IndirectObject *)a.get())->id == ((IndirectObject *)b.get())->id;
	case ObjectType::Stream:
		{
			Stream * sa = (Stream *)a.get();
			Stream * sb = (Stream *)b.get();
			return sa->raw == sb->raw && DictionariesEqual( *sa->dict, *sb->dict );
		}
	default:
		return false;
	}
}

PDictionary CopyDictionary( PDictionary const & d )
{
	PDictionary ret( new Dictionary() );
	if (d)
		for( Dictionary::const_iterator it = d->begin(); it != d->end(); ++it )
			ret->Add( Name( it->first ), it->second );
	return ret;
}

double ToNumber( PObject obj )
{
	if (obj && obj->Type() == ObjectType::Number)
		return (double)((Number *)obj.get())->num;
	if (obj && obj->Type() == ObjectType::Double)
		return ((Double *)obj.get())->num;

	return 0;
}
