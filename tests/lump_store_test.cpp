#include <algorithm>

#include <gtest/gtest.h>

#include "../RpgArchive/lump_store.hpp"
#include "test_utils.hpp"

namespace RpgArchive
{

namespace Tests
{

TEST( LumpStoreTest, PutAndGet )
{
	LumpStore store;
	store.Put( "heroes.reld", LumpData{ 1u, 2u, 3u } );

	const LumpData* const data= store.Get( "heroes.reld" );
	ASSERT_NE( data, nullptr );
	EXPECT_EQ( *data, ( LumpData{ 1u, 2u, 3u } ) );
	EXPECT_TRUE( store.Has( "heroes.reld" ) );
	EXPECT_EQ( store.GetSize( "heroes.reld" ), 3u );
	EXPECT_EQ( store.GetCount(), 1u );
}

TEST( LumpStoreTest, LastPutWins )
{
	LumpStore store;
	store.Put( "a", LumpData{ 1u } );
	store.Put( "a", LumpData{ 7u, 8u } );

	EXPECT_EQ( store.GetCount(), 1u );
	EXPECT_EQ( *store.Get( "a" ), ( LumpData{ 7u, 8u } ) );
}

TEST( LumpStoreTest, AbsentLumpIsNotAnError )
{
	const LumpStore store;

	std::string text= "unchanged";
	EXPECT_EQ( store.Get( "missing" ), nullptr );
	EXPECT_FALSE( store.Has( "missing" ) );
	EXPECT_FALSE( store.GetAsText( "missing", text ) );
	EXPECT_EQ( store.GetSize( "missing" ), 0u );
	EXPECT_EQ( store.GetCount(), 0u );
}

TEST( LumpStoreTest, NamesAreCaseSensitive )
{
	LumpStore store;
	store.Put( "GAME.GEN", LumpData{ 1u } );

	EXPECT_TRUE( store.Has( "GAME.GEN" ) );
	EXPECT_FALSE( store.Has( "game.gen" ) );
}

TEST( LumpStoreTest, GetAsText )
{
	LumpStore store;
	store.Put( "readme.txt", MakeBytes( "Hello, world" ) );

	std::string text;
	ASSERT_TRUE( store.GetAsText( "readme.txt", text ) );
	EXPECT_EQ( text, "Hello, world" );
}

TEST( LumpStoreTest, GetNamesAndClear )
{
	LumpStore store;
	store.Put( "b", LumpData() );
	store.Put( "a", LumpData{ 0u } );

	std::vector<std::string> names;
	store.GetNames( names );
	std::sort( names.begin(), names.end() );
	EXPECT_EQ( names, ( std::vector<std::string>{ "a", "b" } ) );

	// Empty lumps exist.
	EXPECT_TRUE( store.Has( "b" ) );
	EXPECT_EQ( store.GetSize( "b" ), 0u );

	store.Clear();
	EXPECT_EQ( store.GetCount(), 0u );
	EXPECT_FALSE( store.Has( "a" ) );
}

} // namespace Tests

} // namespace RpgArchive
