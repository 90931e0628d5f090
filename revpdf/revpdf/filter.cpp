#include "pch.h"

// The "None" PNG predictor
static void Flate_None( char* dest, const char* src, size_t width )
{
	for( size_t i = 0 ; i < width ; i++ )
		dest[i] = src[i];
}

// The "Sub" PNG predictor
static void Flate_Left( char* dest, const char* src, size_t width, size_t bpp )
{
	for( size_t i = 0 ; i < width ; i++ )
		dest[i] = src[i] + (i >= bpp ? dest[i - bpp] : 0);
}

// The "Up" PNG predictor
static void Flate_Up( char* dest, const char* src, size_t width, const char* prevRow )
{
	if( prevRow )
		for( size_t i = 0 ; i < width ; i++ )
			dest[i] = src[i] + prevRow[i];
	else
		Flate_None( dest, src, width );
}

// The "Average" PNG predictor
static void Flate_Average( char* dest, const char* src, size_t width, size_t bpp, const char* prevRow )
{
	for( size_t i = 0 ; i < width ; i++ )
	{
		int left = i >= bpp ? (unsigned char)dest[i - bpp] : 0;
		int up = prevRow ? (unsigned char)prevRow[i] : 0;
		dest[i] = (char)(src[i] + ((left + up) >> 1));
	}
}

// The "Paeth" PNG predictor
static void Flate_Paeth( char* dest, const char* src, size_t width, size_t bpp, const char* prevRow )
{
	for( size_t i = 0 ; i < width ; i++ )
	{
		int a = i >= bpp ? (unsigned char)dest[i - bpp] : 0;
		int b = prevRow ? (unsigned char)prevRow[i] : 0;
		int c = (prevRow && i >= bpp) ? (unsigned char)prevRow[i - bpp] : 0;
		int p = a + b - c;
		int pa = abs( p - a ), pb = abs( p - b ), pc = abs( p - c );
		int pred = (pa <= pb && pa <= pc) ? a : (pb <= pc ? b : c);
		dest[i] = (char)(src[i] + pred);
	}
}

static long long GetIntParm( PDictionary const & parms, char const * key, long long def, ObjectResolver const & objmap )
{
	if( !parms )
		return def;
	PNumber n = parms->Get<Number>( key, objmap );
	return n ? n->num : def;
}

static bool ApplyPredictor( std::string & data, PDictionary const & filterParms, ObjectResolver const & objmap )
{
	long long predictor = GetIntParm( filterParms, "Predictor", 1, objmap );
	if( predictor == 1 )
		return true;

	if( predictor < 10 || predictor > 15 )
	{
		// TIFF predictor 2 is the only other defined value
		DebugOutput( DebugLevel::Warning, "unsupported predictor %lld", predictor );
		return false;
	}

	long long colors = GetIntParm( filterParms, "Colors", 1, objmap );
	long long bpc = GetIntParm( filterParms, "BitsPerComponent", 8, objmap );
	long long columns = GetIntParm( filterParms, "Columns", 1, objmap );
	if( colors < 1 || bpc < 1 || columns < 1 )
		return false;

	size_t width = (size_t)((colors * bpc * columns + 7) / 8);
	size_t bpp = (size_t)((colors * bpc + 7) / 8);

	std::string out;
	out.resize( (data.size() / (width + 1)) * width );

	const char* current = data.data();
	const char* dataEnd = data.data() + data.size();
	char* current_out = &out[0];
	const char* prev = NULL;

	while( current + width + 1 <= dataEnd )
	{
		switch( *current++ )
		{
		case 0:
			Flate_None( current_out, current, width );
			break;
		case 1:
			Flate_Left( current_out, current, width, bpp );
			break;
		case 2:
			Flate_Up( current_out, current, width, prev );
			break;
		case 3:
			Flate_Average( current_out, current, width, bpp, prev );
			break;
		case 4:
			Flate_Paeth( current_out, current, width, bpp, prev );
			break;
		default:
			DebugOutput( DebugLevel::Warning, "invalid PNG row filter" );
			return false;
		}
		prev = current_out;
		current += width;
		current_out += width;
	}

	out.resize( current_out - out.data() );
	data.swap( out );
	return true;
}

static bool ApplyFilter( const Name& filterName, PDictionary filterParms, std::string & data, ObjectResolver const & objmap )
{
	if( filterName.str == String( "FlateDecode" ) || filterName.str == String( "Fl" ) )
	{
		size_t outputLength = 0;
		char* inflated = Inflate( data.data(), data.data() + data.size(), &outputLength, realloc );
		if( !inflated )
		{
			DebugOutput( DebugLevel::Warning, "(Flate) Fail: corrupt stream data" );
			return false;
		}

		data.assign( inflated, outputLength );
		free( inflated );

		return ApplyPredictor( data, filterParms, objmap );
	}

	DebugOutput( DebugLevel::Warning, "unsupported filter /%s", filterName.str.value.c_str() );
	return false;
}

bool Stream::GetStreamBytes( ObjectResolver const & objmap, std::string & out ) const
{
	out = raw;

	PObject filter = dict->Get( "Filter", objmap );
	if( !filter )
		return true;

	PObject parms = dict->Get( "DecodeParms", objmap );

	if( filter->Type() == ObjectType::Name )
		return ApplyFilter( *boost::static_pointer_cast<Name>( filter ),
			Object::ResolveIndirect_<Dictionary>( parms, objmap ), out, objmap );

	if( filter->Type() != ObjectType::Array )
		return false;

	PArray filters = boost::static_pointer_cast<Array>( filter );
	PArray parmsArray = boost::dynamic_pointer_cast<Array>( parms );

	for( size_t i = 0; i < filters->elements.size(); i++ )
	{
		PName name = Object::ResolveIndirect_<Name>( filters->elements[i], objmap );
		if( !name )
			return false;

		PDictionary filterParms;
		if( parmsArray && i < parmsArray->elements.size() )
			filterParms = Object::ResolveIndirect_<Dictionary>( parmsArray->elements[i], objmap );

		if( !ApplyFilter( *name, filterParms, out, objmap ) )
			return false;
	}

	return true;
}

void Stream::SetStreamBytes( std::string const & data, bool compress )
{
	dict->Remove( "Filter" );
	dict->Remove( "DecodeParms" );

	if( compress )
	{
		size_t outputLength = 0;
		char* deflated = Deflate( data.data(), data.data() + data.size(), &outputLength, realloc );
		if( !deflated )
			throw PdfError( "(Flate) Fail: deflate" );

		raw.assign( deflated, outputLength );
		free( deflated );
		dict->Add( "Filter", PName( new Name( String( "FlateDecode" ) ) ) );
	}
	else
		raw = data;

	dict->Add( "Length", PNumber( new Number( (long long)raw.size() ) ) );
}
