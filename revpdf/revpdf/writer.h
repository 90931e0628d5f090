#pragma once

// Writes the header and then every revision, oldest first, each with its own
// cross-reference section. A revision holding an /Type /XRef object gets a
// cross-reference stream, otherwise a classic table and trailer. Object streams
// are repacked from the current values of their members; writing them into a
// revision without a cross-reference stream is a UsageError.
void WriteDocument( Document const & doc, std::string & out );

// The bytes the document was loaded from, followed by the revisions created in
// memory since. Objects changed inside loaded revisions are not written.
void WriteIncremental( Document const & doc, std::string & out );

// Throws PdfError when the file can't be written.
void SaveFile( Document const & doc, char const * filename, bool incremental );
