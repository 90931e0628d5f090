#pragma once

namespace ObjectType
{
enum ObjectType
{
	Null,
	Array,
	Dictionary,
	Ref,
	Name,
	Bool,
	Number,
	Double,
	String,
	Stream,
	IndirectObject,
};
}

class Object;
typedef boost::shared_ptr<Object> PObject;

class Null;
typedef boost::shared_ptr<Null> PNull;
class Array;
typedef boost::shared_ptr<Array> PArray;
class Bool;
typedef boost::shared_ptr<Bool> PBool;
class Dictionary;
typedef boost::shared_ptr<Dictionary> PDictionary;
class Name;
typedef boost::shared_ptr<Name> PName;
class Number;
typedef boost::shared_ptr<Number> PNumber;
class Double;
typedef boost::shared_ptr<Double> PDouble;
class Stream;
typedef boost::shared_ptr<Stream> PStream;
class String;
typedef boost::shared_ptr<String> PString;
class Indirect;
typedef boost::shared_ptr<Indirect> PIndirect;
class IndirectObject;
typedef boost::shared_ptr<IndirectObject> PIndirectObject;

class ObjectResolver;

struct ObjectId
{
	unsigned num;
	unsigned gen;

	ObjectId()
		: num( 0 ), gen( 0 ) {}

	ObjectId( unsigned num, unsigned gen )
		: num( num ), gen( gen ) {}

	bool operator==( ObjectId const & other ) const
	{
		return num == other.num && gen == other.gen;
	}

	bool operator!=( ObjectId const & other ) const
	{
		return !(*this == other);
	}

	bool operator<( ObjectId const & other ) const
	{
		if (num != other.num)
			return num < other.num;
		return gen < other.gen;
	}
};

class Object
{
public:
	virtual ~Object() {}
	virtual ObjectType::ObjectType Type() const = 0;

	// Follows a reference or an object handle to the value behind it.
	static PObject ResolveIndirect_( PObject p, ObjectResolver const & t );

	template< typename T >
	static boost::shared_ptr<T> ResolveIndirect_( PObject p, ObjectResolver const & t )
	{
		return boost::dynamic_pointer_cast<T>( ResolveIndirect_( p, t ) );
	}
};

#define IMPLEMENT_OBJECT_TYPE( t )\
	ObjectType::ObjectType Type() const { return ObjectType::t; }

class Null : public Object
{
public:
	IMPLEMENT_OBJECT_TYPE( Null );
};

class Array : public Object
{
public:
	std::vector<PObject> elements;

	Array()
	{
	}

	void Add( const PObject& obj )
	{
		elements.push_back( obj );
	}

	IMPLEMENT_OBJECT_TYPE( Array );
};

class String : public Object
{
public:
	std::string value;

	explicit String( std::string const & value )
		: value( value )
	{
	}

	String( const char* start, const char* end )
		: value( start, end )
	{
	}

	String( char const * literalString )
		: value( literalString )
	{}

	bool operator==( const String& other ) const
	{
		return value == other.value;
	}

	bool operator!=( const String& other ) const
	{
		return value != other.value;
	}

	bool operator<( const String& other ) const
	{
		return value < other.value;
	}

	size_t Length() const { return value.size(); }

	IMPLEMENT_OBJECT_TYPE( String );
};

class Name : public Object
{
public:
	const String str;

	Name( const String& str )
		: str( str )
	{
	}

	IMPLEMENT_OBJECT_TYPE( Name );
};

class Number : public Object
{
public:
	long long num;

	explicit Number( long long num )
		: num( num )
	{
	}

	Number( const char* start, const char* end );

	Number( const Number& other )
		: num( other.num )
	{
	}

	IMPLEMENT_OBJECT_TYPE( Number );
};

class Double : public Object
{
public:
	double num;

	explicit Double( double num )
		: num( num )
	{
	}

	Double( char const * start, char const * end );

	Double( Double const & other )
		: num( other.num )
	{
	}

	IMPLEMENT_OBJECT_TYPE( Double );
};

class Dictionary : public Object
{
	std::map<String, PObject> dict;
public:
	typedef std::map<String, PObject>::iterator iterator;
	typedef std::map<String, PObject>::const_iterator const_iterator;

	PObject Get( const Name& name ) const
	{
		const_iterator it = dict.find( name.str );
		if( it != dict.end() )
			return it->second;
		return PObject();
	}

	PObject Get( char const * literalString ) const
	{
		return Get( Name( String( literalString ) ) );
	}

	PObject Get( char const * literalString, const ObjectResolver& objmap ) const
	{
		return Object::ResolveIndirect_( Get( literalString ), objmap );
	}

	template< typename T >
	boost::shared_ptr<T> Get( char const * literalString, const ObjectResolver& objmap ) const
	{
		return boost::dynamic_pointer_cast<T>( Get( literalString, objmap ) );
	}

	void Add( const Name& key, const PObject& value );

	void Add( char const * literalString, const PObject& value )
	{
		Add( Name( String( literalString ) ), value );
	}

	bool Has( char const * literalString ) const
	{
		return dict.find( String( literalString ) ) != dict.end();
	}

	void Remove( char const * literalString )
	{
		dict.erase( String( literalString ) );
	}

	void Remove( String const & key )
	{
		dict.erase( key );
	}

	size_t Size() const { return dict.size(); }

	iterator begin() { return dict.begin(); }
	iterator end() { return dict.end(); }
	const_iterator begin() const { return dict.begin(); }
	const_iterator end() const { return dict.end(); }

	IMPLEMENT_OBJECT_TYPE( Dictionary );
};

// "n g R": identity only, resolved through an ObjectResolver.
class Indirect : public Object
{
public:
	unsigned objectNum;
	unsigned generation;

	Indirect( const Number& objectNum, const Number& generation )
		: objectNum( (unsigned)objectNum.num ), generation( (unsigned)generation.num )
	{
	}

	explicit Indirect( ObjectId id )
		: objectNum( id.num ), generation( id.gen )
	{
	}

	ObjectId Id() const { return ObjectId( objectNum, generation ); }

	IMPLEMENT_OBJECT_TYPE( Ref );
};

class Bool : public Object
{
public:
	const bool value;
	Bool( bool value )
		: value( value )
	{
	}

	IMPLEMENT_OBJECT_TYPE( Bool );
};

class Stream : public Object
{
public:
	PDictionary dict;
	std::string raw;	// bytes as stored, filters still applied

	Stream( const PDictionary& dict, std::string const & raw )
		: dict( dict ), raw( raw )
	{
	}

	// Applies the /Filter chain; false if a filter is unsupported or the data is corrupt.
	bool GetStreamBytes( ObjectResolver const & objmap, std::string & out ) const;

	// Replaces the contents, dropping the old /Filter and /DecodeParms.
	void SetStreamBytes( std::string const & data, bool compress );

	IMPLEMENT_OBJECT_TYPE( Stream );
};

// A materialized indirect object. The instance is shared by the revision that
// holds it, the resolver cache, and every dereferenced value pointing at it, so
// renumbering `id` renumbers it everywhere. An empty `value` marks a freed object;
// number 0 marks a direct value that was wrapped without becoming indirect.
class IndirectObject : public Object
{
public:
	ObjectId id;
	PObject value;

	IndirectObject( ObjectId id, PObject const & value )
		: id( id ), value( value )
	{
	}

	bool IsFree() const { return !value; }
	bool IsIndirect() const { return id.num != 0; }

	IMPLEMENT_OBJECT_TYPE( IndirectObject );
};

// /Type of a dictionary or of a stream's dictionary, "" if none.
std::string GetTypeName( PObject const & value );

// The dictionary of a dictionary or stream value.
PDictionary GetDictionary( PObject const & value );

// Deep comparison of direct values; references compare by identity.
bool ObjectsEqual( PObject const & a, PObject const & b );

PDictionary CopyDictionary( PDictionary const & d );

double ToNumber( PObject obj );
