#pragma once

// Reads the structure of a mapped file: header, startxref, cross-reference
// sections and objects. Everything throws MalformedPdfError carrying the file
// offset where reading failed.
class FileParser
{
	MappedFile const & f;

	char const * At( size_t offset ) const;

public:
	explicit FileParser( MappedFile const & f )
		: f( f )
	{
	}

	MappedFile const & File() const { return f; }

	// "M.N" from the %PDF- header, "" when there is none.
	std::string HeaderVersion() const;

	// Offset named by the last startxref keyword.
	size_t StartXref() const;

	// Parses "n g obj ... endobj" at `offset`; the header must name `id`.
	PObject ParseObjectAt( size_t offset, ObjectId id, ObjectResolver const * objmap ) const;

	// Classic table plus trailer, or an xref stream, at `offset`. A hybrid file's
	// /XRefStm entries are merged into the classic section.
	PRevision ReadRevisionAt( size_t offset, ObjectResolver const & objmap ) const;

	// Builds one revision by scanning the whole file for object headers and trailers.
	PRevision Reconstruct() const;
};
