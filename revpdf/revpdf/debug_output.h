#pragma once

namespace DebugLevel
{
enum DebugLevel
{
	Trace,
	Info,
	Warning,
	Error,
	Silent,
};
}

typedef void (*DebugSink)( DebugLevel::DebugLevel level, char const * message );

// Messages below the threshold are dropped. Default is Warning.
void SetDebugLevel( DebugLevel::DebugLevel level );
DebugLevel::DebugLevel GetDebugLevel();

// Pass 0 to restore the stderr sink.
void SetDebugSink( DebugSink sink );

void DebugOutput( DebugLevel::DebugLevel level, char const * fmt, ... )
#ifdef __GNUC__
	__attribute__(( format( printf, 2, 3 ) ))
#endif
	;
