#include <gtest/gtest.h>

#include "../RpgArchive/common/files.hpp"
#include "../RpgArchive/common/str.hpp"
#include "../RpgArchive/log.hpp"
#include "../RpgArchive/program_arguments.hpp"
#include "../RpgArchive/record_decoders.hpp"
#include "../RpgArchive/settings.hpp"
#include "../RpgArchive/shared_settings_keys.hpp"
#include "test_utils.hpp"

namespace RpgArchive
{

namespace Tests
{

TEST( SettingsTest, DefaultsForMissingFile )
{
	const TemporaryDirectory dir;
	const std::string file_name= ( dir.GetPath() / "missing.cfg" ).string();

	{
		const Settings settings( file_name.c_str() );
		EXPECT_FALSE( settings.IsValue( SettingsKeys::archive_path ) );
		EXPECT_STREQ( settings.GetString( SettingsKeys::archive_path, "default.rpg" ), "default.rpg" );
		EXPECT_EQ( settings.GetInt( "number", 5 ), 5 );
		EXPECT_TRUE( settings.GetBool( SettingsKeys::verbose_log, true ) );
	}

	// Unmodified settings are not written.
	EXPECT_FALSE( std::filesystem::exists( file_name ) );
}

TEST( SettingsTest, SettingsAreStoredAndLoaded )
{
	const TemporaryDirectory dir;
	const std::string file_name= ( dir.GetPath() / "rpg_archive.cfg" ).string();

	{
		Settings settings( file_name.c_str() );
		settings.SetSetting( SettingsKeys::archive_path, "My Games/quest \"1\".rpg" );
		settings.SetSetting( SettingsKeys::print_records, true );
		settings.SetSetting( "number", -42 );
		EXPECT_STREQ( settings.GetOrSetString( SettingsKeys::project_name, "QUEST" ), "QUEST" );
		EXPECT_EQ( settings.GetOrSetInt( "other_number", 7 ), 7 );
	}

	const Settings settings( file_name.c_str() );
	EXPECT_STREQ( settings.GetString( SettingsKeys::archive_path ), "My Games/quest \"1\".rpg" );
	EXPECT_TRUE( settings.GetBool( SettingsKeys::print_records ) );
	EXPECT_EQ( settings.GetInt( "number" ), -42 );
	EXPECT_STREQ( settings.GetString( SettingsKeys::project_name ), "QUEST" );
	EXPECT_EQ( settings.GetInt( "other_number" ), 7 );
}

TEST( SettingsTest, InvalidNumbersAreReplacedWithDefault )
{
	const TemporaryDirectory dir;
	const std::filesystem::path file_path= dir.WriteFile( "test.cfg", MakeBytes( "number abc\nempty \"\"\n" ) );

	Settings settings( file_path.string().c_str() );
	EXPECT_TRUE( settings.IsValue( "empty" ) );
	EXPECT_STREQ( settings.GetString( "empty", "x" ), "" );
	EXPECT_STREQ( settings.GetString( "number" ), "abc" );
	EXPECT_EQ( settings.GetInt( "number", 3 ), 3 );
	EXPECT_EQ( settings.GetOrSetInt( "number", 4 ), 4 );
	EXPECT_EQ( settings.GetInt( "number" ), 4 );
	EXPECT_TRUE( settings.Save() );
}

TEST( ProgramArgumentsTest, Params )
{
	const char* const argv[]=
	{
		"lump_tool",
		"--unpack", "game.rpg",
		"--lump", "a.txt",
		"--legacy",
		"--lump", "b.txt",
		"--out",
	};
	const ProgramArguments args( int( sizeof(argv) / sizeof(argv[0]) ), argv );

	EXPECT_TRUE( args.HasParam( "unpack" ) );
	EXPECT_TRUE( args.HasParam( "legacy" ) );
	EXPECT_FALSE( args.HasParam( "pack" ) );
	EXPECT_FALSE( args.HasParam( "game.rpg" ) );

	EXPECT_STREQ( args.GetParamValue( "unpack" ), "game.rpg" );
	EXPECT_STREQ( args.GetParamValue( "lump" ), "a.txt" );
	EXPECT_EQ( args.GetParamValue( "out" ), nullptr );
	EXPECT_EQ( args.GetParamValue( "missing" ), nullptr );
	EXPECT_STREQ( args.GetParamValue( "out", "." ), "." );

	std::vector<std::string> lumps;
	args.EnumerateAllParamValues( "lump", [&]( const char* const value ) { lumps.emplace_back( value ); } );
	EXPECT_EQ( lumps, ( std::vector<std::string>{ "a.txt", "b.txt" } ) );
}

TEST( StringsTest, Helpers )
{
	EXPECT_TRUE( StartsWith( "tileset001.rgfx", "tileset" ) );
	EXPECT_FALSE( StartsWith( "tile", "tileset" ) );
	EXPECT_TRUE( EndsWith( "tileset001.rgfx", ".rgfx" ) );
	EXPECT_FALSE( EndsWith( "rgfx", ".rgfx" ) );

	EXPECT_EQ( ToUpper( "Quest-1.rpg" ), "QUEST-1.RPG" );
	EXPECT_EQ( ToLower( "TILESET5.RGFX" ), "tileset5.rgfx" );

	const char data[]= { 'a', 'b', '\0', 'c' };
	EXPECT_EQ( CutAtNull( data, 4u ), "ab" );
	EXPECT_EQ( CutAtNull( data, 1u ), "a" );
}

TEST( FilesTest, WholeFileReadWrite )
{
	const TemporaryDirectory dir;
	const std::filesystem::path path= dir.GetPath() / "file.bin";

	EXPECT_TRUE( WriteWholeFile( path, LumpData{ 1u, 2u, 3u } ) );

	LumpData content;
	ASSERT_TRUE( ReadWholeFile( path, content ) );
	EXPECT_EQ( content, ( LumpData{ 1u, 2u, 3u } ) );

	EXPECT_FALSE( ReadWholeFile( dir.GetPath() / "missing.bin", content ) );
	EXPECT_TRUE( content.empty() );
}

TEST( LogTest, CallbackReceivesMessages )
{
	std::vector<std::pair<std::string, Log::LogLevel>> messages;
	Log::SetLogCallback(
		[&]( std::string message, const Log::LogLevel level )
		{
			messages.emplace_back( std::move(message), level );
		} );

	Log::Info( "Lumps: ", 3, ", size: ", 1.5f );
	Log::Warning( "Broken ", "data" );

	// Trailing bytes of legacy data are reported.
	std::vector<HeroData> heroes;
	DecodeHeroData( LumpData( 10u, 0u ), heroes );

	Log::SetLogCallback( nullptr );

	ASSERT_GE( messages.size(), 3u );
	EXPECT_EQ( messages[0].first, "Lumps: 3, size: 1.5" );
	EXPECT_TRUE( messages[0].second == Log::LogLevel::Info );
	EXPECT_EQ( messages[1].first, "Warning: Broken data" );
	EXPECT_TRUE( messages[1].second == Log::LogLevel::Warning );

	bool trailing_bytes_reported= false;
	for( const auto& message : messages )
		trailing_bytes_reported= trailing_bytes_reported || message.first.find( "10 trailing bytes" ) != std::string::npos;
	EXPECT_TRUE( trailing_bytes_reported );
}

} // namespace Tests

} // namespace RpgArchive
