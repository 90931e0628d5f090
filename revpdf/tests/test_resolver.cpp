#include <gtest/gtest.h>

#include "test_helpers.h"

class ResolverTest : public ::testing::Test
{
protected:
	PDocument doc;

	void SetUp()
	{
		doc = ThreeRevisionFile().Load();
		ASSERT_TRUE( doc );
	}
};

TEST_F( ResolverTest, NewestBindingWins )
{
	EXPECT_EQ( 200, NumberValue( doc->GetObject( ObjectId( 2, 0 ) ) ) );
	EXPECT_EQ( 10, NumberValue( doc->GetObject( ObjectId( 1, 0 ) ) ) );
	EXPECT_EQ( 40, NumberValue( doc->GetObject( ObjectId( 4, 0 ) ) ) );
}

TEST_F( ResolverTest, FreeEntryShadowsOlderBinding )
{
	EXPECT_TRUE( !doc->GetObject( ObjectId( 3, 0 ) ) );
	EXPECT_TRUE( !doc->GetObject( ObjectId( 3, 1 ) ) );
}

TEST_F( ResolverTest, GenerationMismatchIsNotFound )
{
	EXPECT_TRUE( !doc->GetObject( ObjectId( 2, 1 ) ) );
	EXPECT_TRUE( !doc->GetObject( ObjectId( 9, 0 ) ) );
	EXPECT_TRUE( !doc->GetObject( ObjectId( 0, 0 ) ) );
}

TEST_F( ResolverTest, RepeatedResolutionReturnsSameInstance )
{
	PIndirectObject a = doc->GetObject( ObjectId( 2, 0 ) );
	PIndirectObject b = doc->GetObject( ObjectId( 2, 0 ) );
	ASSERT_TRUE( a );
	EXPECT_EQ( a.get(), b.get() );

	// the instance is the one stored in the revision that binds it
	EXPECT_EQ( a, doc->Revisions().Current()->Loaded( 2 ) );
}

TEST_F( ResolverTest, DerefFollowsReferences )
{
	PObject ref( new Indirect( ObjectId( 1, 0 ) ) );
	PObject target = doc->Deref( ref );
	ASSERT_TRUE( target );
	EXPECT_EQ( ObjectType::IndirectObject, target->Type() );

	PObject plain( new Number( 5 ) );
	EXPECT_EQ( plain, doc->Deref( plain ) );
}

TEST_F( ResolverTest, DeletedObjectIsGone )
{
	ASSERT_TRUE( doc->GetObject( ObjectId( 1, 0 ) ) );
	doc->Delete( ObjectId( 1, 0 ) );
	EXPECT_TRUE( !doc->GetObject( ObjectId( 1, 0 ) ) );
}

TEST_F( ResolverTest, AddedObjectGetsNextFreeNumber )
{
	PIndirectObject added = doc->Add( PNumber( new Number( 50 ) ) );
	EXPECT_EQ( ObjectId( 5, 0 ), added->id );
	EXPECT_EQ( added, doc->GetObject( ObjectId( 5, 0 ) ) );
	EXPECT_EQ( added, doc->Revisions().Current()->Loaded( 5 ) );

	PIndirectObject older = doc->Add( PNumber( new Number( 60 ) ), 0 );
	EXPECT_EQ( ObjectId( 6, 0 ), older->id );
	EXPECT_EQ( older, doc->Revisions()[0]->Loaded( 6 ) );

	EXPECT_THROW( doc->Add( PNumber( new Number( 1 ) ), 7 ), UsageError );
}

TEST( ResolverObjectStreamTest, CompressedObjectsResolve )
{
	PdfBuilder b;
	std::vector< std::pair<unsigned, std::string> > members;
	members.push_back( std::make_pair( 1u, std::string( "<< /A 1 /B [2 0 R] >>" ) ) );
	members.push_back( std::make_pair( 2u, std::string( "42" ) ) );
	b.ObjectStreamObject( 5, members );
	b.XrefStream( 6 );

	PDocument doc = b.Load();
	ASSERT_TRUE( doc );

	EXPECT_EQ( 42, NumberValue( doc->GetObject( ObjectId( 2, 0 ) ) ) );

	PDictionary first = DictValue( doc->GetObject( ObjectId( 1, 0 ) ) );
	ASSERT_TRUE( first );
	EXPECT_EQ( 1, ToNumber( first->Get( "A" ) ) );

	PIndirectObject container = doc->GetObject( ObjectId( 5, 0 ) );
	ASSERT_TRUE( container );
	EXPECT_EQ( "ObjStm", GetTypeName( container->value ) );
}

TEST( ResolverReentrancyTest, SelfContainingObjectStream )
{
	CapturedLog log;

	PdfBuilder b;
	std::vector< std::pair<unsigned, std::string> > members;
	members.push_back( std::make_pair( 5u, std::string( "55" ) ) );
	b.ObjectStreamObject( 5, members );
	b.XrefStream( 6 );

	PDocument doc = b.Load();
	ASSERT_TRUE( doc );

	EXPECT_TRUE( !doc->GetObject( ObjectId( 5, 0 ) ) );
	EXPECT_TRUE( log.Contains( "needed to load itself" ) );
}

TEST( ResolverReentrancyTest, SelfReferencingLength )
{
	PdfBuilder b;
	b.Object( 1, 0, "<< /Length 1 0 R >>\nstream\nabc\nendstream" );
	b.Section();

	CapturedLog log;
	PDocument doc = b.Load();
	ASSERT_TRUE( doc );

	PIndirectObject obj = doc->GetObject( ObjectId( 1, 0 ) );
	ASSERT_TRUE( obj );
	PStream stream = boost::dynamic_pointer_cast<Stream>( obj->value );
	ASSERT_TRUE( stream );
	EXPECT_EQ( "abc", stream->raw );
}

TEST( ResolverDamageTest, UnparsableObjectIsNotFound )
{
	CapturedLog log;

	PdfBuilder b;
	b.Object( 1, 0, ">> oops" );
	b.Object( 2, 0, "2" );
	b.Section();

	PDocument doc = b.Load();
	ASSERT_TRUE( doc );

	EXPECT_TRUE( !doc->GetObject( ObjectId( 1, 0 ) ) );
	EXPECT_TRUE( log.Contains( "could not be loaded" ) );
	EXPECT_EQ( 2, NumberValue( doc->GetObject( ObjectId( 2, 0 ) ) ) );
}

TEST( ResolverDamageTest, UnlistedObjectIsNotFound )
{
	PdfBuilder b;
	b.Object( 1, 0, "1" );
	b.Raw( "9 0 obj\n9\nendobj\n" );
	b.Section();

	PDocument doc = b.Load();
	ASSERT_TRUE( doc );

	// the entry for object 1 is fine, object 9 has no entry at all
	EXPECT_EQ( 1, NumberValue( doc->GetObject( ObjectId( 1, 0 ) ) ) );
	EXPECT_TRUE( !doc->GetObject( ObjectId( 9, 0 ) ) );
}

TEST( ResolverDamageTest, IndirectLengthIsResolved )
{
	PdfBuilder b;
	b.Object( 1, 0, "<< /Length 2 0 R >>\nstream\nhello\nendstream" );
	b.Object( 2, 0, "5" );
	b.Section();

	PDocument doc = b.Load();
	PIndirectObject obj = doc->GetObject( ObjectId( 1, 0 ) );
	ASSERT_TRUE( obj );
	PStream stream = boost::dynamic_pointer_cast<Stream>( obj->value );
	ASSERT_TRUE( stream );
	EXPECT_EQ( "hello", stream->raw );
}

TEST( ResolverDamageTest, DeeplyNestedObjectIsNotFound )
{
	CapturedLog log;

	PdfBuilder b;
	b.Object( 1, 0, "<< /Type /Catalog /A " + std::string( 200000, '[' ) + " >>" );
	b.Object( 2, 0, "<< /A [[[1]]] >>" );
	b.Section( "/Root 1 0 R" );

	PDocument doc = b.Load();
	ASSERT_TRUE( doc );

	EXPECT_TRUE( !doc->GetObject( ObjectId( 1, 0 ) ) );
	EXPECT_TRUE( log.Contains( "could not be loaded" ) );
	EXPECT_TRUE( doc->GetObject( ObjectId( 2, 0 ) ) );
}
