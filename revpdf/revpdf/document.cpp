#include "pch.h"
#include "file_parser.h"

Document::Document( DocumentConfig const & config )
	: f( 0 ), parser( 0 ), config( config ), revisions(), resolver( revisions ), version( config.defaultVersion )
{
}

Document::~Document()
{
	for( RevisionChain::const_iterator rev = revisions.begin(); rev != revisions.end(); ++rev )
	{
		for( Revision::const_iterator it = (*rev)->begin(); it != (*rev)->end(); ++it )
			it->second->value.reset();
		(*rev)->Clear();
	}
	resolver.Release();

	delete parser;
	delete f;
}

void Document::Load( MappedFile * file )
{
	f = file;
	parser = new FileParser( *f );
	resolver.SetParser( parser );

	version = parser->HeaderVersion();
	if( version.empty() )
	{
		DebugOutput( DebugLevel::Warning, "Not a PDF: bogus header, assuming version %s", config.defaultVersion.c_str() );
		version = config.defaultVersion;
	}

	size_t entryPoint;
	try
	{
		entryPoint = parser->StartXref();
	}
	catch( MalformedPdfError const & e )
	{
		if( !config.reconstructOnError )
			throw;

		DebugOutput( DebugLevel::Warning, "%s, reconstructing", e.what() );
		revisions.Reconstruct( *parser );
		return;
	}

	revisions.Load( *parser, entryPoint, resolver, config.reconstructOnError );
}

PDocument LoadFile( char const * filename, DocumentConfig const & config )
{
	MappedFile * f = new MappedFile( filename );
	if (!f->IsValid())
	{
		delete f;
		DebugOutput( DebugLevel::Error, "Failed opening file %s", filename );
		return PDocument();
	}

	PDocument doc( new Document( config ) );
	doc->Load( f );
	return doc;
}

PDocument LoadFromMemory( std::string const & bytes, DocumentConfig const & config )
{
	MappedFile * f = new MappedFile( bytes );
	if (!f->IsValid())
	{
		delete f;
		DebugOutput( DebugLevel::Error, "Failed loading empty buffer" );
		return PDocument();
	}

	PDocument doc( new Document( config ) );
	doc->Load( f );
	return doc;
}

PIndirectObject Document::GetObject( ObjectId id ) const
{
	return resolver.Resolve( id );
}

PObject Document::Deref( PObject const & value ) const
{
	if (!value)
		return value;

	if (value->Type() == ObjectType::Ref)
		return resolver.Resolve( ((Indirect *)value.get())->Id() );

	return value;
}

PIndirectObject Document::Wrap( PObject const & value ) const
{
	if (value && value->Type() == ObjectType::IndirectObject)
		return boost::static_pointer_cast<IndirectObject>( value );

	if (value && value->Type() == ObjectType::Ref)
		return resolver.Resolve( ((Indirect *)value.get())->Id() );

	return PIndirectObject( new IndirectObject( ObjectId(), value ? value : PObject( new Null() ) ) );
}

PIndirectObject Document::Add( PObject const & value )
{
	return Add( value, revisions.Size() - 1 );
}

PIndirectObject Document::Add( PObject const & value, size_t revisionIndex )
{
	if (revisionIndex >= revisions.Size())
		throw UsageError( "revision index out of range" );

	PIndirectObject obj = Wrap( value );
	if (!obj)
		throw UsageError( "can't add a reference to a missing object" );

	PRevision revision = revisions[revisionIndex];

	if (obj->IsIndirect())
	{
		if (revision->Loaded( obj->id.num ) == obj)
			return obj;
	}
	else
	{
		unsigned next = 1;
		for( RevisionChain::const_iterator it = revisions.begin(); it != revisions.end(); ++it )
			next = std::max( next, (*it)->NextFreeNumber() );
		obj->id = ObjectId( next, 0 );
	}

	revision->Add( obj );
	resolver.Invalidate( obj->id );
	return obj;
}

void Document::Delete( ObjectId id )
{
	for( RevisionChain::const_iterator it = revisions.begin(); it != revisions.end(); ++it )
		if ((*it)->Contains( id.num ))
			(*it)->Delete( id.num, true );

	resolver.Invalidate( id );
}

PDictionary Document::FindCatalog() const
{
	return Object::ResolveIndirect_<Dictionary>( Trailer()->Get( "Root" ), resolver );
}

PDictionary Document::Catalog()
{
	PDictionary catalog = FindCatalog();
	if (catalog)
		return catalog;

	catalog.reset( new Dictionary() );
	catalog->Add( "Type", PName( new Name( String( "Catalog" ) ) ) );
	Trailer()->Add( "Root", Add( catalog ) );
	return catalog;
}

void Document::EachObject( bool onlyCurrent, ObjectList & out ) const
{
	std::set<unsigned> seen;

	for( RevisionChain::const_iterator it = revisions.end(); it != revisions.begin(); )
	{
		PRevision revision = *--it;
		resolver.LoadRevision( *revision );

		for( Revision::const_iterator obj = revision->begin(); obj != revision->end(); ++obj )
			if (seen.insert( obj->first ).second)
				out.push_back( std::make_pair( obj->second, revision ) );

		if (onlyCurrent)
			break;
	}
}

static bool IsVersionString( std::string const & v )
{
	return v.size() == 3 && v[0] >= '0' && v[0] <= '9' && v[1] == '.' && v[2] >= '0' && v[2] <= '9';
}

std::string Document::Version() const
{
	PDictionary catalog = FindCatalog();
	PName catalogVersion = catalog ? catalog->Get<Name>( "Version", resolver ) : PName();

	if (catalogVersion && IsVersionString( catalogVersion->str.value ) && version < catalogVersion->str.value)
		return catalogVersion->str.value;

	return version;
}

void Document::SetVersion( std::string const & v )
{
	if (!IsVersionString( v ))
		throw UsageError( "PDF version must follow format M.N" );
	version = v;
}

static PDictionary GetPageInner( Document * doc, PDictionary node, size_t n, size_t a, size_t depth )
{
	// page trees with a /Kids cycle
	if (depth > 256)
		throw MalformedPdfError( "page tree is too deep", 0 );

	PArray kids = node->Get<Array>( "Kids", doc->Resolver() );
	if (!kids)
		return node;

	for( std::vector<PObject>::iterator it = kids->elements.begin(); it != kids->elements.end(); it++ )
	{
		PDictionary kid = Object::ResolveIndirect_<Dictionary>( *it, doc->Resolver() );
		if (!kid)
			continue;

		PNumber countP = kid->Get<Number>( "Count", doc->Resolver() );
		size_t count = countP ? (size_t)countP->num : 1;

		if (n >= a && n < a + count)
			return GetPageInner( doc, kid, n, a, depth + 1 );
		else
			a += count;
	}

	return PDictionary();
}

PDictionary Document::GetPage( size_t n )
{
	PDictionary catalog = FindCatalog();
	PDictionary pageRoot = catalog ? catalog->Get<Dictionary>( "Pages", resolver ) : PDictionary();
	if (!pageRoot || n >= GetPageCount())
		return PDictionary();

	return GetPageInner( this, pageRoot, n, 0, 0 );
}

static size_t GetPageIndexInner( Document * doc, PDictionary node, size_t depth )
{
	PDictionary parent = node->Get<Dictionary>( "Parent", doc->Resolver() );
	if (!parent) return 0;

	// page trees with a /Parent cycle
	if (depth > 256)
		throw MalformedPdfError( "page tree is too deep", 0 );

	PArray children = parent->Get<Array>( "Kids", doc->Resolver() );
	if (!children)
		throw MalformedPdfError( "page tree node without /Kids", 0 );

	size_t n = 0;
	for (std::vector<PObject>::const_iterator it = children->elements.begin(); it != children->elements.end(); it++)
	{
		PDictionary child = Object::ResolveIndirect_<Dictionary>( *it, doc->Resolver() );
		if (!child)
			continue;
		if (node == child)
			return n + GetPageIndexInner( doc, parent, depth + 1 );
		PNumber count = child->Get<Number>( "Count", doc->Resolver() );
		n += count ? (size_t)count->num : 1;
	}

	throw UsageError( "page is not a kid of its /Parent" );
}

size_t Document::GetPageIndex( PDictionary page )
{
	return GetPageIndexInner( this, page, 0 );
}

PDictionary Document::GetNextPage( PDictionary page )
{
	return GetPage( GetPageIndex( page ) + 1 );
}

PDictionary Document::GetPrevPage( PDictionary page )
{
	size_t index = GetPageIndex( page );
	return index ? GetPage( index - 1 ) : PDictionary();
}

size_t Document::GetPageCount()
{
	PDictionary catalog = FindCatalog();
	PDictionary pageRoot = catalog ? catalog->Get<Dictionary>( "Pages", resolver ) : PDictionary();
	PNumber count = pageRoot ? pageRoot->Get<Number>( "Count", resolver ) : PNumber();
	return (count && count->num > 0) ? (size_t)count->num : 0;
}
