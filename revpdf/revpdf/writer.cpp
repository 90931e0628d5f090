#include "pch.h"
#include "serializer.h"
#include "object_stream.h"
#include "writer.h"

static const size_t NoPrev = (size_t)-1;

static std::string ToString( unsigned long long n )
{
	char sz[32];
	snprintf( sz, sizeof( sz ), "%llu", n );
	return sz;
}

// Repacks `container` from the current values of the members named in its
// header and records their compressed entries.
static void PackContainer( Document const & doc, Revision const & revision, IndirectObject const & container,
	XrefSection & section, std::set<unsigned> & packed )
{
	Stream & stream = *(Stream *)container.value.get();

	std::vector<unsigned> numbers;
	try
	{
		ObjectStream::ReadMemberNumbers( stream, doc.Resolver(), numbers );
	}
	catch( MalformedPdfError const & e )
	{
		DebugOutput( DebugLevel::Warning, "object stream %u %u is unreadable, writing it empty: %s",
			container.id.num, container.id.gen, e.what() );
		numbers.clear();
	}

	std::vector<PIndirectObject> members;
	for( std::vector<unsigned>::const_iterator it = numbers.begin(); it != numbers.end(); ++it )
	{
		PIndirectObject member = revision.Loaded( *it );
		if (!member || packed.count( *it ) || !CanPackIntoObjectStream( member, revision.trailer, doc.Config() ))
			continue;

		members.push_back( member );
		packed.insert( *it );
	}

	ObjectStream::Pack( stream, members );

	for( size_t i = 0; i < members.size(); i++ )
		section.addCompressed( members[i]->id.num, container.id.num, i );
}

// Appends one revision and returns the offset of its cross-reference section.
// `size` carries the running /Size across revisions.
static size_t WriteRevision( Document const & doc, Revision & revision, size_t prevXref,
	unsigned & size, std::string & out )
{
	doc.Resolver().LoadRevision( revision );

	PIndirectObject xrefStream;
	std::vector<PIndirectObject> containers;

	for( Revision::const_iterator it = revision.begin(); it != revision.end(); ++it )
	{
		PIndirectObject const & obj = it->second;
		if (obj->IsFree())
			continue;

		std::string type = GetTypeName( obj->value );
		if (type == "XRef" && !xrefStream && obj->value->Type() == ObjectType::Stream)
			xrefStream = obj;
		else if (type == "ObjStm" && obj->value->Type() == ObjectType::Stream)
			containers.push_back( obj );
	}

	if (!containers.empty() && !xrefStream)
		throw UsageError( "object streams can only be written with a cross-reference stream" );

	XrefSection section;
	if (prevXref == NoPrev)
		section.addFree( 0, 65535 );

	std::set<unsigned> packed;
	for( std::vector<PIndirectObject>::const_iterator it = containers.begin(); it != containers.end(); ++it )
		PackContainer( doc, revision, **it, section, packed );

	for( Revision::const_iterator it = revision.begin(); it != revision.end(); ++it )
	{
		PIndirectObject const & obj = it->second;
		if (it->first == 0 || packed.count( it->first ) || obj == xrefStream)
			continue;

		// stale cross-reference streams are dropped with the section they described
		if (obj->IsFree() || GetTypeName( obj->value ) == "XRef")
		{
			section.addFree( it->first, obj->id.gen );
			continue;
		}

		section.addInUse( it->first, obj->id.gen, out.size() );
		SerializeIndirect( *obj, out );
	}

	PDictionary trailer = CopyDictionary( revision.trailer );
	trailer->Remove( "Prev" );
	trailer->Remove( "XRefStm" );
	if (prevXref != NoPrev)
		trailer->Add( "Prev", PNumber( new Number( (long long)prevXref ) ) );

	size_t startxref = out.size();

	if (!xrefStream)
	{
		size = std::max( size, section.maxNum() + 1 );
		trailer->Add( "Size", PNumber( new Number( size ) ) );

		section.WriteTable( out );
		out += "trailer\n";
		Serialize( trailer, out );
		out += "\n";
	}
	else
	{
		section.addInUse( xrefStream->id.num, xrefStream->id.gen, startxref );
		size = std::max( size, section.maxNum() + 1 );
		trailer->Add( "Size", PNumber( new Number( size ) ) );

		std::string data;
		PArray index, w;
		section.WriteStream( data, index, w );

		trailer->Add( "Type", PName( new Name( String( "XRef" ) ) ) );
		trailer->Add( "Index", index );
		trailer->Add( "W", w );

		PStream stream( new Stream( trailer, std::string() ) );
		stream->SetStreamBytes( data, true );
		SerializeIndirect( IndirectObject( xrefStream->id, stream ), out );
	}

	out += "startxref\n" + ToString( startxref ) + "\n%%EOF\n";

	DebugOutput( DebugLevel::Trace, "revision written at %zu with %u entries", startxref, (unsigned)section.size() );
	return startxref;
}

void WriteDocument( Document const & doc, std::string & out )
{
	out += "%PDF-" + doc.Version() + "\n%\xCF\xEC\xFF\xE8\xD7\xCB\xCD\n";

	size_t prevXref = NoPrev;
	unsigned size = 0;

	RevisionChain const & revisions = doc.Revisions();
	for( RevisionChain::const_iterator it = revisions.begin(); it != revisions.end(); ++it )
		prevXref = WriteRevision( doc, **it, prevXref, size, out );
}

void WriteIncremental( Document const & doc, std::string & out )
{
	MappedFile const * f = doc.File();
	if (!f)
		throw UsageError( "incremental writing needs a document loaded from a file" );

	out.append( f->F(), f->End() );
	if (out[out.size() - 1] != '\n' && out[out.size() - 1] != '\r')
		out += '\n';

	size_t prevXref = NoPrev;
	unsigned size = 0;

	RevisionChain const & revisions = doc.Revisions();
	for( RevisionChain::const_iterator it = revisions.begin(); it != revisions.end(); ++it )
		size = std::max( size, (*it)->NextFreeNumber() );

	for( RevisionChain::const_iterator it = revisions.begin(); it != revisions.end(); ++it )
	{
		if ((*it)->fileOffset != Revision::InMemory)
			prevXref = (*it)->fileOffset;
		else
			prevXref = WriteRevision( doc, **it, prevXref, size, out );
	}
}

void SaveFile( Document const & doc, char const * filename, bool incremental )
{
	std::string out;
	if (incremental)
		WriteIncremental( doc, out );
	else
		WriteDocument( doc, out );

	FILE * f = fopen( filename, "wb" );
	if (!f)
		throw PdfError( std::string( "can't open " ) + filename + " for writing" );

	size_t written = fwrite( out.data(), 1, out.size(), f );
	int closed = fclose( f );

	if (written != out.size() || closed != 0)
		throw PdfError( std::string( "failed writing " ) + filename );
}
