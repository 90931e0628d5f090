#pragma once

class FileParser;

// All revisions of a document, oldest first. The last one is current and takes
// every edit. Never empty.
class RevisionChain
{
	std::vector<PRevision> revisions;

public:
	typedef std::vector<PRevision>::const_iterator const_iterator;

	// A chain holding one empty revision.
	RevisionChain();

	// Follows /Prev (and /XRefStm) from the section at `entryPoint`. A repeated
	// offset ends the walk, an unreadable older section truncates the chain there,
	// and an unreadable newest section falls back to Reconstruct when allowed.
	void Load( FileParser const & parser, size_t entryPoint, ObjectResolver const & objmap, bool reconstructOnError );

	// Replaces the chain with the single revision a full scan of the file yields.
	void Reconstruct( FileParser const & parser );

	// New empty current revision; its trailer copies the current one minus /Prev and /XRefStm.
	PRevision Add();

	// Both throw UsageError when only one revision is left.
	void Delete( size_t index );
	void Delete( PRevision const & revision );

	// Collapses the chain into its oldest revision; newer objects and the newest trailer win.
	void Merge( ObjectResolver const & objmap );

	PRevision Current() const { return revisions.back(); }
	PRevision operator[]( size_t index ) const { return revisions.at( index ); }
	size_t Size() const { return revisions.size(); }

	// Index of `revision`, Size() if it is not part of the chain.
	size_t IndexOf( PRevision const & revision ) const;

	const_iterator begin() const { return revisions.begin(); }
	const_iterator end() const { return revisions.end(); }
};
