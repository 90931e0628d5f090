#include <cstdio>
#include <cstdarg>

#include "debug_output.h"

static DebugLevel::DebugLevel threshold = DebugLevel::Warning;
static DebugSink sink = 0;

static char const * LevelName( DebugLevel::DebugLevel level )
{
	switch( level )
	{
	case DebugLevel::Trace: return "trace";
	case DebugLevel::Info: return "info";
	case DebugLevel::Warning: return "warning";
	case DebugLevel::Error: return "error";
	default: return "";
	}
}

static void StderrSink( DebugLevel::DebugLevel level, char const * message )
{
	fprintf( stderr, "(revpdf) %s: %s\n", LevelName( level ), message );
}

void SetDebugLevel( DebugLevel::DebugLevel level )
{
	threshold = level;
}

DebugLevel::DebugLevel GetDebugLevel()
{
	return threshold;
}

void SetDebugSink( DebugSink s )
{
	sink = s;
}

void DebugOutput( DebugLevel::DebugLevel level, char const * fmt, ... )
{
	if (level < threshold || level == DebugLevel::Silent)
		return;

	char sz[512];
	va_list args;
	va_start( args, fmt );
	vsnprintf( sz, sizeof( sz ), fmt, args );
	va_end( args );

	(sink ? sink : StderrSink)( level, sz );
}
