// main.cpp - lumps extraction and packing tool

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include <SDL.h>

#include "../../RpgArchive/archive.hpp"
#include "../../RpgArchive/common/files.hpp"
#include "../../RpgArchive/container_format.hpp"
#include "../../RpgArchive/log.hpp"
#include "../../RpgArchive/program_arguments.hpp"
#include "../../RpgArchive/settings.hpp"
#include "../../RpgArchive/shared_settings_keys.hpp"
using namespace RpgArchive;

static void PrintUsage()
{
	Log::User( "Usage:" );
	Log::User( "  lump_tool --list <archive>" );
	Log::User( "  lump_tool --unpack <archive> [--out <directory>] [--lump <name>]..." );
	Log::User( "  lump_tool --pack <directory> --out <file> [--legacy]" );
	Log::User( "  lump_tool --repack <modern container> --out <file>" );
}

// Lumps names are archive-relative. Names, leading outside of output directory, are not allowed.
static bool IsSafeLumpPath( const std::filesystem::path& path )
{
	if( path.empty() || path.is_absolute() || path.has_root_name() )
		return false;

	for( const std::filesystem::path& component : path )
	{
		if( component == ".." )
			return false;
	}

	return true;
}

static void GetSortedLumpNames( const Archive& archive, std::vector<std::string>& out_names )
{
	out_names.clear();
	archive.GetLumpNames( out_names );
	std::sort( out_names.begin(), out_names.end() );
}

static int ListArchive( const char* const archive_path )
{
	Archive archive;
	if( !archive.LoadArchive( archive_path ) )
		return -1;

	Log::User( "Container: ", ContainerKindName( archive.GetContainerKind() ), ", lumps: ", archive.GetLumpCount() );

	std::vector<std::string> names;
	GetSortedLumpNames( archive, names );
	for( const std::string& name : names )
		Log::User( name, " ", archive.GetLumpSize( name ) );

	return 0;
}

static int UnpackArchive( const ProgramArguments& args, const char* const archive_path, const char* const out_dir )
{
	Archive archive;
	if( !archive.LoadArchive( archive_path ) )
		return -1;

	std::vector<std::string> names;
	args.EnumerateAllParamValues( "lump", [&]( const char* const name ) { names.emplace_back( name ); } );
	if( names.empty() )
		GetSortedLumpNames( archive, names );

	int result= 0;
	for( const std::string& name : names )
	{
		const LumpData* const data= archive.GetLump( name );
		if( data == nullptr )
		{
			Log::Warning( "Lump \"", name, "\" not found" );
			result= -1;
			continue;
		}

		const std::filesystem::path lump_path( name );
		if( !IsSafeLumpPath( lump_path ) )
		{
			Log::Warning( "Lump \"", name, "\" has unsafe name, skipping" );
			result= -1;
			continue;
		}

		const std::filesystem::path out_path= std::filesystem::path( out_dir ) / lump_path;

		std::error_code ec;
		if( out_path.has_parent_path() )
			std::filesystem::create_directories( out_path.parent_path(), ec );
		if( ec )
		{
			Log::Warning( "Could not create directory \"", out_path.parent_path().string(), "\": ", ec.message() );
			result= -1;
			continue;
		}

		Log::User( "Write \"", out_path.string(), "\"" );
		if( !WriteWholeFile( out_path, *data ) )
		{
			Log::Warning( "Could not write file \"", out_path.string(), "\"" );
			result= -1;
		}
	}

	return result;
}

static int PackDirectory( const char* const directory, const char* const out_file, const bool legacy )
{
	Archive archive;
	if( !archive.LoadArchive( directory ) )
		return -1;

	if( archive.GetContainerKind() != ContainerKind::Directory )
	{
		Log::Warning( "\"", directory, "\" is not a directory" );
		return -1;
	}

	std::vector<std::string> names;
	GetSortedLumpNames( archive, names );

	LumpData container;
	if( legacy )
		SerializeLegacyContainer( names, archive.GetLumps(), container );
	else
	{
		const ModernContainerDirectory container_directory= BuildModernContainerDirectory( names, archive.GetLumps() );
		if( !SerializeModernContainer( container_directory, archive.GetLumps(), container ) )
			return -1;
	}

	if( !WriteWholeFile( out_file, container ) )
	{
		Log::Warning( "Could not write file \"", out_file, "\"" );
		return -1;
	}

	Log::User( "Packed ", names.size(), " lumps into \"", out_file, "\", ", container.size(), " bytes" );
	return 0;
}

static int RepackContainer( const char* const archive_path, const char* const out_file )
{
	Archive archive;
	if( !archive.LoadArchive( archive_path ) )
		return -1;

	if( archive.GetContainerKind() != ContainerKind::Modern )
	{
		Log::Warning( "\"", archive_path, "\" is not a modern container" );
		return -1;
	}

	LumpData container;
	if( !SerializeModernContainer( archive.GetModernDirectory(), archive.GetLumps(), container ) ||
		!WriteWholeFile( out_file, container ) )
	{
		Log::Warning( "Could not repack \"", archive_path, "\"" );
		return -1;
	}

	Log::User( "Repacked \"", archive_path, "\" into \"", out_file, "\"" );
	return 0;
}

extern "C" int main( int argc, char *argv[] )
{
	const ProgramArguments args( argc, argv );
	const Settings settings( "rpg_archive.cfg" );
	const char* const out= args.GetParamValue( "out" );

	if( const char* const archive_path= args.GetParamValue( "list" ) )
		return ListArchive( archive_path );

	if( const char* const archive_path= args.GetParamValue( "unpack" ) )
		return UnpackArchive( args, archive_path, out == nullptr ? settings.GetString( SettingsKeys::output_dir, "." ) : out );

	if( const char* const directory= args.GetParamValue( "pack" ) )
	{
		if( out == nullptr )
		{
			Log::User( "Error, expected file name after --out" );
			return -1;
		}
		return PackDirectory( directory, out, args.HasParam( "legacy" ) );
	}

	if( const char* const archive_path= args.GetParamValue( "repack" ) )
	{
		if( out == nullptr )
		{
			Log::User( "Error, expected file name after --out" );
			return -1;
		}
		return RepackContainer( archive_path, out );
	}

	PrintUsage();
	return -1;
}
