#pragma once

#include "pch.h"

// Emits PDF bytes revision by revision, computing object and section offsets.
// Entries recorded since the last section go into the next one.
class PdfBuilder
{
	struct Entry
	{
		::Xref::Kind kind;
		unsigned gen;
		size_t pos;
		unsigned stream;
	};

	std::string data;
	std::map<unsigned, Entry> pending;
	size_t lastXref;
	bool first;
	unsigned size;

	static std::string Num( unsigned long long n )
	{
		char sz[32];
		snprintf( sz, sizeof( sz ), "%llu", n );
		return sz;
	}

	void Record( unsigned num, ::Xref::Kind kind, unsigned gen, size_t pos, unsigned stream )
	{
		Entry e = { kind, gen, pos, stream };
		pending[num] = e;
	}

	std::string Trailer( std::string const & extra, bool linkPrev, unsigned total ) const
	{
		std::string t = "/Size " + Num( total );
		if (linkPrev && lastXref != NoXref)
			t += " /Prev " + Num( lastXref );
		if (!extra.empty())
			t += " " + extra;
		return t;
	}

	// /Size never shrinks from one section to the next
	unsigned PendingSize()
	{
		if (!pending.empty())
			size = std::max( size, pending.rbegin()->first + 1 );
		return size;
	}

	void End( size_t xref )
	{
		data += "startxref\n" + Num( xref ) + "\n%%EOF\n";
		lastXref = xref;
		first = false;
		pending.clear();
	}

public:
	static const size_t NoXref = (size_t)-1;

	explicit PdfBuilder( char const * version = "1.2" )
		: data( std::string( "%PDF-" ) + version + "\n%\xE2\xE3\xCF\xD3\n" ), lastXref( NoXref ), first( true ), size( 1 )
	{
	}

	size_t Offset() const { return data.size(); }
	size_t LastXref() const { return lastXref; }
	std::string const & Bytes() const { return data; }

	void Raw( std::string const & text ) { data += text; }

	// Writes "num gen obj <body> endobj" and returns its offset.
	size_t Object( unsigned num, unsigned gen, std::string const & body )
	{
		size_t pos = data.size();
		data += Num( num ) + " " + Num( gen ) + " obj\n" + body + "\nendobj\n";
		Record( num, ::Xref::InUse, gen, pos, 0 );
		return pos;
	}

	// `dict` is the dictionary content without /Length.
	size_t StreamObject( unsigned num, unsigned gen, std::string const & dict, std::string const & content )
	{
		return Object( num, gen, "<< " + dict + " /Length " + Num( content.size() ) + " >>\nstream\n" +
			content + "\nendstream" );
	}

	// An uncompressed object stream holding `members`, all recorded as compressed entries.
	size_t ObjectStreamObject( unsigned num, std::vector< std::pair<unsigned, std::string> > const & members )
	{
		std::string header, body;
		for( size_t i = 0; i < members.size(); i++ )
		{
			header += Num( members[i].first ) + " " + Num( body.size() ) + " ";
			body += members[i].second + " ";
		}

		size_t pos = StreamObject( num, 0, "/Type /ObjStm /N " + Num( members.size() ) +
			" /First " + Num( header.size() ), header + body );

		for( size_t i = 0; i < members.size(); i++ )
			Record( members[i].first, ::Xref::Compressed, 0, i, num );
		return pos;
	}

	void Free( unsigned num, unsigned gen )
	{
		Record( num, ::Xref::Free, gen, 0, 0 );
	}

	// Classic table plus trailer. /Size covers the highest number recorded;
	// /Prev points at the previous section unless `linkPrev` is false.
	size_t Section( std::string const & trailerExtra = "", bool linkPrev = true )
	{
		if (first)
			Record( 0, ::Xref::Free, 65535, 0, 0 );

		size_t pos = data.size();
		data += "xref\n";

		char sz[32];
		for( std::map<unsigned, Entry>::const_iterator it = pending.begin(); it != pending.end(); ++it )
		{
			data += Num( it->first ) + " 1\n";
			if (it->second.kind == ::Xref::Free)
				snprintf( sz, sizeof( sz ), "%010u %05u f \n", 0u, it->second.gen );
			else
				snprintf( sz, sizeof( sz ), "%010llu %05u n \n", (unsigned long long)it->second.pos, it->second.gen );
			data += sz;
		}

		data += "trailer\n<< " + Trailer( trailerExtra, linkPrev, PendingSize() ) + " >>\n";
		End( pos );
		return pos;
	}

	// Uncompressed cross-reference stream object `num` with /W [1 4 2].
	size_t XrefStream( unsigned num, std::string const & trailerExtra = "", bool linkPrev = true )
	{
		if (first)
			Record( 0, ::Xref::Free, 65535, 0, 0 );

		size_t pos = data.size();
		Record( num, ::Xref::InUse, 0, pos, 0 );

		std::string rows, index;
		for( std::map<unsigned, Entry>::const_iterator it = pending.begin(); it != pending.end(); ++it )
		{
			Entry const & e = it->second;
			unsigned long long f2 = e.kind == ::Xref::InUse ? e.pos : e.kind == ::Xref::Compressed ? e.stream : 0;
			unsigned long long f3 = e.kind == ::Xref::Compressed ? e.pos : e.gen;

			rows += (char)(e.kind == ::Xref::Free ? 0 : e.kind == ::Xref::InUse ? 1 : 2);
			for( int i = 3; i >= 0; i-- )
				rows += (char)((f2 >> (8 * i)) & 0xff);
			rows += (char)((f3 >> 8) & 0xff);
			rows += (char)(f3 & 0xff);

			index += Num( it->first ) + " 1 ";
		}

		std::string dict = "/Type /XRef /W [1 4 2] /Index [" + index + "] " +
			Trailer( trailerExtra, linkPrev, PendingSize() );

		data += Num( num ) + " 0 obj\n<< " + dict + " /Length " + Num( rows.size() ) + " >>\nstream\n" +
			rows + "\nendstream\nendobj\n";
		pending.erase( num );
		End( pos );
		return pos;
	}

	PDocument Load( DocumentConfig const & config = DocumentConfig() ) const
	{
		return LoadFromMemory( data, config );
	}
};

// Three revisions: (1,0) = 10, (2,0) = 20 and (3,0) = 30 first; then (3,0)
// freed and (4,0) = 40 added; then (2,0) rebound to 200.
inline PdfBuilder ThreeRevisionFile()
{
	PdfBuilder b;
	b.Object( 1, 0, "10" );
	b.Object( 2, 0, "20" );
	b.Object( 3, 0, "30" );
	b.Section();

	b.Free( 3, 1 );
	b.Object( 4, 0, "40" );
	b.Section();

	b.Object( 2, 0, "200" );
	b.Section();
	return b;
}

// A catalog, a page tree with two pages and one font shared by both pages.
inline PdfBuilder SimplePagesFile()
{
	PdfBuilder b;
	b.Object( 1, 0, "<< /Type /Catalog /Pages 2 0 R >>" );
	b.Object( 2, 0, "<< /Type /Pages /Kids [3 0 R 4 0 R] /Count 2 >>" );
	b.Object( 3, 0, "<< /Type /Page /Parent 2 0 R /Resources << /Font << /F1 5 0 R >> >> /MediaBox [0 0 612 792] >>" );
	b.Object( 4, 0, "<< /Type /Page /Parent 2 0 R /Resources << /Font << /F1 5 0 R >> >> /Rotate 0 >>" );
	b.Object( 5, 0, "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>" );
	b.Section( "/Root 1 0 R" );
	return b;
}

// SimplePagesFile plus a revision that gives page 4 a content stream with an
// indirect /Length and adds two objects nothing points at.
inline PdfBuilder PagesWithOrphans()
{
	PdfBuilder b = SimplePagesFile();
	b.Object( 4, 0, "<< /Type /Page /Parent 2 0 R /Resources << /Font << /F1 5 0 R >> >> /Rotate 0 /Contents 8 0 R >>" );
	b.Object( 6, 0, "<< /Orphan true >>" );
	b.Object( 7, 0, "[6 0 R]" );
	b.Object( 8, 0, "<< /Length 9 0 R >>\nstream\nBT ET\nendstream" );
	b.Object( 9, 0, "5" );
	b.Section( "/Root 1 0 R" );
	return b;
}

inline long long NumberValue( PIndirectObject const & obj )
{
	if (!obj || !obj->value || obj->value->Type() != ObjectType::Number)
		return -1;
	return ((Number *)obj->value.get())->num;
}

inline PDictionary DictValue( PIndirectObject const & obj )
{
	return obj ? boost::dynamic_pointer_cast<Dictionary>( obj->value ) : PDictionary();
}

// Collects warnings while alive.
class CapturedLog
{
	static std::vector<std::string> & Messages()
	{
		static std::vector<std::string> messages;
		return messages;
	}

	static void Sink( DebugLevel::DebugLevel level, char const * message )
	{
		if (level >= DebugLevel::Warning)
			Messages().push_back( message );
	}

public:
	CapturedLog()
	{
		Messages().clear();
		SetDebugSink( Sink );
	}

	~CapturedLog()
	{
		SetDebugSink( 0 );
		Messages().clear();
	}

	std::vector<std::string> const & Lines() const { return Messages(); }

	bool Contains( char const * fragment ) const
	{
		for( size_t i = 0; i < Messages().size(); i++ )
			if (Messages()[i].find( fragment ) != std::string::npos)
				return true;
		return false;
	}
};
