#include "pch.h"
#include "token.h"
#include "serializer.h"

std::string SerializeName( std::string const & name )
{
	std::string out( "/" );
	char sz[4];

	for( std::string::const_iterator it = name.begin(); it != name.end(); ++it )
	{
		unsigned char c = (unsigned char)*it;
		if( c < 0x21 || c > 0x7e || c == '#' || IsPdfDelimiter( (char)c ) )
		{
			snprintf( sz, sizeof( sz ), "#%02X", c );
			out += sz;
		}
		else
			out += (char)c;
	}

	return out;
}

std::string SerializeString( std::string const & value )
{
	std::string out( "(" );

	for( std::string::const_iterator it = value.begin(); it != value.end(); ++it )
	{
		switch( *it )
		{
		case '(':
		case ')':
		case '\\':
			out += '\\';
			out += *it;
			break;
		case '\r':
			out += "\\r";
			break;
		default:
			out += *it;
		}
	}

	return out + ")";
}

std::string SerializeDouble( double value )
{
	char sz[64];
	snprintf( sz, sizeof( sz ), "%.6f", value );

	std::string out( sz );
	while( !out.empty() && out[out.size() - 1] == '0' )
		out.erase( out.size() - 1 );
	if( !out.empty() && out[out.size() - 1] == '.' )
		out.erase( out.size() - 1 );

	if( out == "-0" || out.empty() )
		return "0";
	return out;
}

static void SerializeRef( ObjectId id, std::string & out )
{
	char sz[32];
	snprintf( sz, sizeof( sz ), "%u %u R", id.num, id.gen );
	out += sz;
}

static void SerializeDictionary( Dictionary const & dict, std::string & out )
{
	out += "<<";
	for( Dictionary::const_iterator it = dict.begin(); it != dict.end(); ++it )
	{
		out += SerializeName( it->first.value );
		out += ' ';
		Serialize( it->second, out );
	}
	out += ">>";
}

void Serialize( PObject const & obj, std::string & out )
{
	if( !obj )
	{
		out += "null";
		return;
	}

	switch( obj->Type() )
	{
	case ObjectType::Null:
		out += "null";
		break;

	case ObjectType::Bool:
		out += ((Bool *)obj.get())->value ? "true" : "false";
		break;

	case ObjectType::Number:
		{
			char sz[32];
			snprintf( sz, sizeof( sz ), "%lld", ((Number *)obj.get())->num );
			out += sz;
		}
		break;

	case ObjectType::Double:
		out += SerializeDouble( ((Double *)obj.get())->num );
		break;

	case ObjectType::String:
		out += SerializeString( ((String *)obj.get())->value );
		break;

	case ObjectType::Name:
		out += SerializeName( ((Name *)obj.get())->str.value );
		break;

	case ObjectType::Array:
		{
			Array * array = (Array *)obj.get();
			out += '[';
			for( size_t i = 0; i < array->elements.size(); i++ )
			{
				if( i )
					out += ' ';
				Serialize( array->elements[i], out );
			}
			out += ']';
		}
		break;

	case ObjectType::Dictionary:
		SerializeDictionary( *(Dictionary *)obj.get(), out );
		break;

	case ObjectType::Ref:
		SerializeRef( ((Indirect *)obj.get())->Id(), out );
		break;

	case ObjectType::IndirectObject:
		{
			IndirectObject * handle = (IndirectObject *)obj.get();
			if( handle->IsIndirect() )
				SerializeRef( handle->id, out );
			else
				Serialize( handle->value, out );
		}
		break;

	case ObjectType::Stream:
		{
			Stream * stream = (Stream *)obj.get();
			Dictionary dict( *stream->dict );
			dict.Add( "Length", PNumber( new Number( (long long)stream->raw.size() ) ) );

			SerializeDictionary( dict, out );
			out += "stream\n";
			out += stream->raw;
			out += "\nendstream";
		}
		break;
	}
}

void SerializeIndirect( IndirectObject const & obj, std::string & out )
{
	char sz[32];
	snprintf( sz, sizeof( sz ), "%u %u obj\n", obj.id.num, obj.id.gen );
	out += sz;
	Serialize( obj.value, out );
	out += "\nendobj\n";
}
