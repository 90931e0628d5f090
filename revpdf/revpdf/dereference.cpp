#include "pch.h"
#include "dereference.h"

namespace
{
	// Walks the object graph with an explicit stack of pending handles and
	// composites, so that long /Next or /Parent chains don't exhaust the call stack.
	class Dereferencer
	{
		Document const & doc;
		std::set<Object const *> composites;
		std::set<IndirectObject const *> marked;
		std::vector<PObject> pending;

		PObject Replace( PObject value );
		PIndirectObject Visit( PIndirectObject const & obj );
		void ExpandDictionary( Dictionary & dict, bool isStreamDict );
		void Expand( PObject const & item );

	public:
		explicit Dereferencer( Document const & doc )
			: doc( doc )
		{
		}

		PObject Walk( PObject const & root )
		{
			PObject result = Replace( root );
			while( !pending.empty() )
			{
				PObject item = pending.back();
				pending.pop_back();
				Expand( item );
			}
			return result;
		}

		bool Marked( IndirectObject const * obj ) const { return marked.count( obj ) != 0; }
	};

	PIndirectObject Dereferencer::Visit( PIndirectObject const & obj )
	{
		if (marked.insert( obj.get() ).second && obj->value)
			pending.push_back( obj );
		return obj;
	}

	// What a slot holding `value` should hold once dereferenced. Anything that
	// still needs walking is queued.
	PObject Dereferencer::Replace( PObject value )
	{
		for(;;)
		{
			if (!value)
				return value;

			switch( value->Type() )
			{
			case ObjectType::Ref:
				{
					PIndirectObject target = doc.GetObject( ((Indirect *)value.get())->Id() );
					if (!target)
						return PObject( new Null() );
					return Visit( target );
				}

			case ObjectType::IndirectObject:
				{
					PIndirectObject handle = boost::static_pointer_cast<IndirectObject>( value );
					if (!handle->IsIndirect())
					{
						if (!handle->value)
							return PObject( new Null() );
						value = handle->value;
						continue;
					}
					if (handle->IsFree())
						return PObject( new Null() );
					return Visit( handle );
				}

			case ObjectType::Dictionary:
			case ObjectType::Stream:
			case ObjectType::Array:
				if (composites.insert( value.get() ).second)
					pending.push_back( value );
				return value;

			default:
				return value;
			}
		}
	}

	void Dereferencer::Expand( PObject const & item )
	{
		switch( item->Type() )
		{
		case ObjectType::IndirectObject:
			{
				IndirectObject & obj = *(IndirectObject *)item.get();
				obj.value = Replace( obj.value );
				break;
			}

		case ObjectType::Dictionary:
			ExpandDictionary( *(Dictionary *)item.get(), false );
			break;

		case ObjectType::Stream:
			ExpandDictionary( *((Stream *)item.get())->dict, true );
			break;

		case ObjectType::Array:
			{
				std::vector<PObject> & elements = ((Array *)item.get())->elements;
				for( std::vector<PObject>::iterator it = elements.begin(); it != elements.end(); ++it )
					*it = Replace( *it );
				break;
			}

		default:
			break;
		}
	}

	void Dereferencer::ExpandDictionary( Dictionary & dict, bool isStreamDict )
	{
		for( Dictionary::iterator it = dict.begin(); it != dict.end(); ++it )
		{
			// a stream's length is resolved but does not keep its object alive
			if (isStreamDict && it->first == String( "Length" ) && it->second->Type() == ObjectType::Ref)
			{
				PIndirectObject length = doc.GetObject( ((Indirect *)it->second.get())->Id() );
				it->second = length ? PObject( length ) : PObject( new Null() );
				continue;
			}

			if (isStreamDict && it->first == String( "Length" ) && it->second->Type() == ObjectType::IndirectObject)
				continue;

			it->second = Replace( it->second );
		}
	}
}

PObject DereferenceInPlace( Document const & doc, PObject const & root )
{
	Dereferencer d( doc );
	return d.Walk( root );
}

void DereferenceAll( Document const & doc, std::vector<PIndirectObject> & unused )
{
	Dereferencer d( doc );
	d.Walk( doc.Trailer() );

	ObjectList objects;
	doc.EachObject( false, objects );

	for( ObjectList::const_iterator it = objects.begin(); it != objects.end(); ++it )
	{
		PIndirectObject const & obj = it->first;
		if (obj->IsFree() || d.Marked( obj.get() ))
			continue;

		std::string type = GetTypeName( obj->value );
		if (type == "ObjStm" || type == "XRef")
			continue;

		unused.push_back( obj );
	}
}
