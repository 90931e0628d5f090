#include <gtest/gtest.h>

#include "test_helpers.h"
#include "parse.h"
#include "serializer.h"
#include "file_parser.h"

static PObject ParseText( std::string const & text )
{
	char const * p = text.data();
	return Parse( p, text.data() + text.size() );
}

static std::string SerializeText( std::string const & text )
{
	std::string out;
	Serialize( ParseText( text ), out );
	return out;
}

TEST( ParserTest, Names )
{
	PName name = boost::dynamic_pointer_cast<Name>( ParseText( "/A#20B" ) );
	ASSERT_TRUE( name );
	EXPECT_EQ( "A B", name->str.value );

	name = boost::dynamic_pointer_cast<Name>( ParseText( "/Type/Page" ) );
	ASSERT_TRUE( name );
	EXPECT_EQ( "Type", name->str.value );
}

TEST( ParserTest, LiteralStrings )
{
	PString s = boost::dynamic_pointer_cast<String>( ParseText( "(a\\(b\\)c\\n\\053 (nested))" ) );
	ASSERT_TRUE( s );
	EXPECT_EQ( "a(b)c\n+ (nested)", s->value );

	s = boost::dynamic_pointer_cast<String>( ParseText( "(line\\\nbreak)" ) );
	ASSERT_TRUE( s );
	EXPECT_EQ( "linebreak", s->value );
}

TEST( ParserTest, HexStrings )
{
	PString s = boost::dynamic_pointer_cast<String>( ParseText( "<48 65 6c6C6f>" ) );
	ASSERT_TRUE( s );
	EXPECT_EQ( "Hello", s->value );

	// a missing last digit is 0
	s = boost::dynamic_pointer_cast<String>( ParseText( "<414>" ) );
	ASSERT_TRUE( s );
	EXPECT_EQ( std::string( "A@" ), s->value );
}

TEST( ParserTest, NumbersAndReferences )
{
	PObject o = ParseText( "12 0 R" );
	ASSERT_EQ( ObjectType::Ref, o->Type() );
	EXPECT_EQ( ObjectId( 12, 0 ), ((Indirect *)o.get())->Id() );

	o = ParseText( "12 0 obj" );
	ASSERT_EQ( ObjectType::Number, o->Type() );
	EXPECT_EQ( 12, ToNumber( o ) );

	o = ParseText( "-0.5" );
	ASSERT_EQ( ObjectType::Double, o->Type() );
	EXPECT_DOUBLE_EQ( -0.5, ToNumber( o ) );
}

TEST( ParserTest, DictionariesDropNullValues )
{
	PDictionary dict = boost::dynamic_pointer_cast<Dictionary>(
		ParseText( "<< /A 1 /B null /C [1 2 /R 3 0 R] /D << /E true >> >>" ) );
	ASSERT_TRUE( dict );

	EXPECT_EQ( 3u, dict->Size() );
	EXPECT_FALSE( dict->Has( "B" ) );

	PArray c = boost::dynamic_pointer_cast<Array>( dict->Get( "C" ) );
	ASSERT_TRUE( c );
	ASSERT_EQ( 4u, c->elements.size() );
	EXPECT_EQ( ObjectType::Number, c->elements[1]->Type() );
	EXPECT_EQ( ObjectType::Name, c->elements[2]->Type() );
	EXPECT_EQ( ObjectType::Ref, c->elements[3]->Type() );
}

TEST( ParserTest, SyntaxErrorsThrow )
{
	EXPECT_THROW( ParseText( "<< 1 2 >>" ), MalformedPdfError );
	EXPECT_THROW( ParseText( ">>" ), MalformedPdfError );
	EXPECT_THROW( ParseText( "[1 2" ), MalformedPdfError );
	EXPECT_THROW( ParseText( "" ), MalformedPdfError );
}

TEST( ParserTest, IndirectHeaderMustMatch )
{
	std::string text = "4 0 obj\n<< /A 1 >>\nendobj\n";
	char const * end = text.data() + text.size();

	PObject o = ParseIndirect( text.data(), end, ObjectId( 4, 0 ), 0 );
	ASSERT_TRUE( o );
	EXPECT_EQ( ObjectType::Dictionary, o->Type() );

	EXPECT_THROW( ParseIndirect( text.data(), end, ObjectId( 4, 1 ), 0 ), MalformedPdfError );
	EXPECT_THROW( ParseIndirect( text.data(), end, ObjectId( 5, 0 ), 0 ), MalformedPdfError );
}

TEST( ParserTest, WrongStreamLengthFallsBackToEndstream )
{
	std::string text = "1 0 obj\n<< /Length 3 >>\nstream\nhello world\nendstream\nendobj\n";

	PStream s = boost::dynamic_pointer_cast<Stream>(
		ParseIndirect( text.data(), text.data() + text.size(), ObjectId( 1, 0 ), 0 ) );
	ASSERT_TRUE( s );
	EXPECT_EQ( "hello world", s->raw );

	text = "1 0 obj\n<< /Length 5 >>\nstream\r\nhello\r\nendstream\nendobj\n";
	s = boost::dynamic_pointer_cast<Stream>(
		ParseIndirect( text.data(), text.data() + text.size(), ObjectId( 1, 0 ), 0 ) );
	ASSERT_TRUE( s );
	EXPECT_EQ( "hello", s->raw );
}

TEST( ParserTest, ObjectHeader )
{
	std::string text = "17 3 obj null";
	char const * p = text.data();
	ObjectId id;
	ASSERT_TRUE( ParseObjectHeader( p, text.data() + text.size(), id ) );
	EXPECT_EQ( ObjectId( 17, 3 ), id );
	EXPECT_EQ( text.data() + 8, p );

	std::string bad = "17 obj";
	p = bad.data();
	EXPECT_FALSE( ParseObjectHeader( p, bad.data() + bad.size(), id ) );
	EXPECT_EQ( bad.data(), p );
}

TEST( SerializerTest, Values )
{
	EXPECT_EQ( "<</A 1/B [true false null]/C (x\\)y)/D 0.25>>",
		SerializeText( "<< /A 1 /B [true false null] /C (x\\)y) /D 0.250 >>" ) );
	EXPECT_EQ( "/A#20B#2F", SerializeText( "/A#20B#2f" ) );
	EXPECT_EQ( "3 1 R", SerializeText( "3 1 R" ) );
	EXPECT_EQ( "-2", SerializeDouble( -2.0 ) );
	EXPECT_EQ( "0", SerializeDouble( -0.0000001 ) );
}

TEST( SerializerTest, HandlesWriteAsReferencesOrValues )
{
	PIndirectObject indirect( new IndirectObject( ObjectId( 7, 0 ), PObject( new Number( 1 ) ) ) );
	PIndirectObject direct( new IndirectObject( ObjectId(), PObject( new Number( 9 ) ) ) );

	PArray array( new Array() );
	array->Add( indirect );
	array->Add( direct );

	std::string out;
	Serialize( array, out );
	EXPECT_EQ( "[7 0 R 9]", out );

	out.clear();
	SerializeIndirect( *indirect, out );
	EXPECT_EQ( "7 0 obj\n1\nendobj\n", out );
}

TEST( SerializerTest, StreamLengthMatchesData )
{
	PDictionary dict( new Dictionary() );
	dict->Add( "Length", PObject( new Indirect( ObjectId( 9, 0 ) ) ) );
	PStream stream( new Stream( dict, "abcd" ) );

	std::string out;
	Serialize( stream, out );
	EXPECT_EQ( "<</Length 4>>stream\nabcd\nendstream", out );

	// the stored dictionary is left alone
	EXPECT_EQ( ObjectType::Ref, dict->Get( "Length" )->Type() );
}

TEST( FileParserTest, HeaderVersionAndStartXref )
{
	PdfBuilder b( "1.5" );
	b.Object( 1, 0, "1" );
	size_t xref = b.Section();

	MappedFile f( b.Bytes() );
	FileParser parser( f );
	EXPECT_EQ( "1.5", parser.HeaderVersion() );
	EXPECT_EQ( xref, parser.StartXref() );

	// junk before the header is skipped
	MappedFile junk( std::string( "garbage\n" ) + b.Bytes() );
	EXPECT_EQ( "1.5", FileParser( junk ).HeaderVersion() );

	MappedFile none( std::string( "no header here, startxref\n5\n%%EOF\n" ) );
	EXPECT_EQ( "", FileParser( none ).HeaderVersion() );
}

TEST( FileParserTest, BogusStartXref )
{
	MappedFile missing( std::string( "%PDF-1.4\n1 0 obj 1 endobj\n%%EOF\n" ) );
	EXPECT_THROW( FileParser( missing ).StartXref(), MalformedPdfError );

	MappedFile outside( std::string( "%PDF-1.4\nstartxref\n999999\n%%EOF\n" ) );
	EXPECT_THROW( FileParser( outside ).StartXref(), MalformedPdfError );
}

TEST( FilterTest, FlateRoundTrip )
{
	RevisionChain chain;
	ObjectResolver objmap( chain );

	std::string data;
	for( int i = 0; i < 100; i++ )
		data += "BT /F1 12 Tf (repeated text) Tj ET\n";

	PStream stream( new Stream( PDictionary( new Dictionary() ), std::string() ) );
	stream->SetStreamBytes( data, true );

	EXPECT_LT( stream->raw.size(), data.size() );
	ASSERT_TRUE( stream->dict->Has( "Filter" ) );

	std::string decoded;
	ASSERT_TRUE( stream->GetStreamBytes( objmap, decoded ) );
	EXPECT_EQ( data, decoded );

	stream->SetStreamBytes( "plain", false );
	EXPECT_FALSE( stream->dict->Has( "Filter" ) );
	EXPECT_EQ( "plain", stream->raw );
}

TEST( FilterTest, UnsupportedFilterIsReported )
{
	CapturedLog log;
	RevisionChain chain;
	ObjectResolver objmap( chain );

	PDictionary dict( new Dictionary() );
	dict->Add( "Filter", PName( new Name( String( "JBIG2Decode" ) ) ) );
	Stream stream( dict, "xx" );

	std::string out;
	EXPECT_FALSE( stream.GetStreamBytes( objmap, out ) );
	EXPECT_TRUE( log.Contains( "unsupported filter" ) );
}

TEST( ParserTest, NestingIsLimited )
{
	std::string ok = std::string( 512, '[' ) + std::string( 512, ']' );
	EXPECT_EQ( ObjectType::Array, ParseText( ok )->Type() );

	std::string deep = std::string( 513, '[' ) + std::string( 513, ']' );
	EXPECT_THROW( ParseText( deep ), MalformedPdfError );

	std::string dicts;
	for( int i = 0; i < 600; i++ )
		dicts += "<< /A ";
	EXPECT_THROW( ParseText( dicts ), MalformedPdfError );
}

TEST( ParserTest, NegativeReferenceIsRejected )
{
	EXPECT_THROW( ParseText( "-1 0 R" ), MalformedPdfError );
	EXPECT_THROW( ParseText( "[4 -2 R]" ), MalformedPdfError );

	// without the R these are plain numbers
	EXPECT_EQ( -1, ToNumber( ParseText( "-1 0" ) ) );
}
