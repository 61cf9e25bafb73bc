// main.cpp - prints summary of game data of archive

#include <string>

#include <SDL.h>

#include "../../RpgArchive/game_data.hpp"
#include "../../RpgArchive/game_data_loader.hpp"
#include "../../RpgArchive/log.hpp"
#include "../../RpgArchive/program_arguments.hpp"
#include "../../RpgArchive/settings.hpp"
#include "../../RpgArchive/shared_settings_keys.hpp"
using namespace RpgArchive;

namespace
{

const char g_settings_file_name[]= "rpg_archive.cfg";

template<class Record>
void PrintNamedRecords( const char* const category, const std::vector<Record>& records, const bool print_records )
{
	Log::User( category, ": ", records.size() );
	if( !print_records )
		return;

	for( size_t i= 0u; i < records.size(); i++ )
		Log::User( "  ", i, " \"", records[i].name, "\"" );
}

void PrintGeneral( const GameData& game_data )
{
	if( !game_data.has_general )
	{
		Log::User( "General data: absent" );
		return;
	}

	const GeneralData& general= game_data.general;
	Log::User( "Title: \"", general.title, "\"" );
	if( !general.author.empty() )
		Log::User( "Author: \"", general.author, "\"" );
	Log::User( "Start: map ", general.starting_map, " at ", general.starting_x, " ", general.starting_y, ", gold ", general.starting_gold );
	Log::User( "Starting heroes: ", general.starting_heroes.size(), ", starting items: ", general.starting_items.size() );
}

void PrintMaps( const std::vector<MapData>& maps, const bool print_records )
{
	Log::User( "Maps: ", maps.size() );
	if( !print_records )
		return;

	for( size_t i= 0u; i < maps.size(); i++ )
	{
		const MapData& map= maps[i];
		Log::User(
			"  ", i, " ", map.width, "x", map.height,
			", layers: ", map.layers.size(),
			", tileset: ", map.tileset_id,
			", npcs: ", map.npcs.size(),
			", events: ", map.events.size() );
	}
}

void PrintTilesets( const std::vector<TilesetData>& tilesets, const bool print_records )
{
	Log::User( "Tilesets: ", tilesets.size() );
	if( !print_records )
		return;

	for( const TilesetData& tileset : tilesets )
		Log::User(
			"  ", tileset.id,
			" tiles: ", tileset.tiles.size(),
			", tile size: ", tileset.tile_size,
			", animations: ", tileset.animations.size() );
}

} // namespace

extern "C" int main( int argc, char *argv[] )
{
	const ProgramArguments args( argc, argv );
	Settings settings( g_settings_file_name );

	// Command line params override settings and are stored for next run.
	if( const char* const archive_path= args.GetParamValue( "archive" ) )
		settings.SetSetting( SettingsKeys::archive_path, archive_path );
	if( const char* const project_name= args.GetParamValue( "project" ) )
		settings.SetSetting( SettingsKeys::project_name, project_name );
	if( args.HasParam( "verbose" ) )
		settings.SetSetting( SettingsKeys::verbose_log, true );
	if( args.HasParam( "records" ) )
		settings.SetSetting( SettingsKeys::print_records, true );

	Log::SetConsoleLevel(
		settings.GetOrSetBool( SettingsKeys::verbose_log, false )
			? Log::LogLevel::Info
			: Log::LogLevel::Warning );

	const std::string archive_path= settings.GetString( SettingsKeys::archive_path );
	if( archive_path.empty() )
	{
		Log::User( "Usage: game_data_dump --archive <path> [--project <name>] [--records] [--verbose]" );
		return -1;
	}

	GameDataLoader loader;
	loader.SetProjectName( settings.GetString( SettingsKeys::project_name ) );

	const GameDataConstPtr game_data= loader.LoadGameData( archive_path );
	if( game_data == nullptr )
	{
		Log::User( "Could not load archive \"", archive_path, "\"" );
		return -1;
	}

	const bool print_records= settings.GetOrSetBool( SettingsKeys::print_records, false );
	const Archive& archive= loader.GetArchive();

	Log::User( "Archive: \"", archive_path, "\", ", ContainerKindName( archive.GetContainerKind() ), ", lumps: ", archive.GetLumpCount() );
	Log::User( "Project: ", loader.GetProjectName() );

	PrintGeneral( *game_data );
	PrintNamedRecords( "Heroes", game_data->heroes, print_records );
	PrintNamedRecords( "Enemies", game_data->enemies, print_records );
	PrintMaps( game_data->maps, print_records );
	PrintNamedRecords( "Items", game_data->items, print_records );
	PrintNamedRecords( "Spells", game_data->spells, print_records );
	PrintNamedRecords( "Scripts", game_data->scripts, print_records );
	PrintNamedRecords( "Textures", game_data->textures, print_records );
	PrintNamedRecords( "Audio", game_data->audio, print_records );
	PrintNamedRecords( "Saves", game_data->saves, print_records );
	PrintTilesets( game_data->tilesets, print_records );

	return 0;
}
