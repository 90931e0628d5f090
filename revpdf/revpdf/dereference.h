#pragma once

// Replaces every reference reachable from `root` with the shared handle of the
// object it names, and every handle that was never made indirect with its value.
// References that can't be resolved become null. Returns the new root value.
PObject DereferenceInPlace( Document const & doc, PObject const & root );

// Dereferences everything reachable from the current trailer and collects the
// objects of the chain that were never reached. Object and cross-reference
// streams are not reported; an object reached only as a stream's /Length is.
void DereferenceAll( Document const & doc, std::vector<PIndirectObject> & unused );
