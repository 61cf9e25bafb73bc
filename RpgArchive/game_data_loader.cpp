#include <cctype>
#include <cstdio>
#include <set>

#include "common/str.hpp"
#include "load_stream.hpp"
#include "log.hpp"
#include "record_decoders.hpp"

#include "game_data_loader.hpp"

namespace RpgArchive
{

namespace
{

const char g_default_project_name[]= "GAME";

const char g_tileset_lump_prefix[]= "tileset";
const char g_tileset_lump_extension[]= ".rgfx";
constexpr unsigned int g_max_tileset_id_digits= 9u;

// Runs category loader. Exceptions are logged and treated as absent data.
template<class Func>
bool LoadCategorySafe( const char* const category_name, const Func& func )
{
	try
	{
		return func();
	}
	catch( const std::exception& e )
	{
		Log::Warning( "Failed to load ", category_name, ": ", e.what() );
		return false;
	}
}

template<class Record>
void LoadRecordsSafe(
	const DataCategory category,
	std::vector<Record>& out_records,
	bool (GameDataLoader::*load_func)( std::vector<Record>& ) const,
	const GameDataLoader& loader )
{
	const bool loaded=
		LoadCategorySafe(
			DataCategoryName( category ),
			[&]{ return (loader.*load_func)( out_records ); } );

	if( !loaded )
		out_records.clear();
}

} // namespace

const char* DataCategoryName( const DataCategory category )
{
	switch( category )
	{
	case DataCategory::General: return "general";
	case DataCategory::Heroes: return "heroes";
	case DataCategory::Enemies: return "enemies";
	case DataCategory::Maps: return "maps";
	case DataCategory::Items: return "items";
	case DataCategory::Spells: return "spells";
	case DataCategory::Scripts: return "scripts";
	case DataCategory::Textures: return "textures";
	case DataCategory::Audio: return "audio";
	case DataCategory::Saves: return "saves";
	};

	RA_ASSERT(false);
	return "";
}

GameDataLoader::GameDataLoader()
{}

GameDataLoader::~GameDataLoader()
{}

GameDataConstPtr GameDataLoader::LoadGameData( const std::filesystem::path& path )
{
	if( !LoadArchive( path ) )
	{
		Log::Warning( "Can not load game data from \"", path.string(), "\"" );
		return nullptr;
	}

	const GameDataPtr game_data= std::make_shared<GameData>();

	game_data->has_general=
		LoadCategorySafe(
			DataCategoryName( DataCategory::General ),
			[&]{ return LoadGeneralData( game_data->general ); } );
	if( !game_data->has_general )
		game_data->general= GeneralData();

	LoadRecordsSafe( DataCategory::Heroes, game_data->heroes, &GameDataLoader::LoadHeroData, *this );
	LoadRecordsSafe( DataCategory::Enemies, game_data->enemies, &GameDataLoader::LoadEnemyData, *this );
	LoadRecordsSafe( DataCategory::Maps, game_data->maps, &GameDataLoader::LoadMapData, *this );
	LoadRecordsSafe( DataCategory::Items, game_data->items, &GameDataLoader::LoadItemData, *this );
	LoadRecordsSafe( DataCategory::Spells, game_data->spells, &GameDataLoader::LoadSpellData, *this );
	LoadRecordsSafe( DataCategory::Scripts, game_data->scripts, &GameDataLoader::LoadScriptData, *this );
	LoadRecordsSafe( DataCategory::Textures, game_data->textures, &GameDataLoader::LoadTextureData, *this );
	LoadRecordsSafe( DataCategory::Audio, game_data->audio, &GameDataLoader::LoadAudioData, *this );
	LoadRecordsSafe( DataCategory::Saves, game_data->saves, &GameDataLoader::LoadSaveData, *this );

	std::vector<int> tileset_ids;
	GetAvailableTilesetIds( tileset_ids );
	for( const int tileset_id : tileset_ids )
	{
		TilesetData tileset;
		if( LoadCategorySafe( "tileset", [&]{ return LoadTilesetData( tileset_id, tileset ); } ) )
			game_data->tilesets.push_back( std::move(tileset) );
	}

	Log::Info(
		"Game data loaded. Heroes: ", game_data->heroes.size(),
		", enemies: ", game_data->enemies.size(),
		", maps: ", game_data->maps.size(),
		", items: ", game_data->items.size(),
		", spells: ", game_data->spells.size(),
		", scripts: ", game_data->scripts.size(),
		", textures: ", game_data->textures.size(),
		", audio: ", game_data->audio.size(),
		", saves: ", game_data->saves.size(),
		", tilesets: ", game_data->tilesets.size() );

	return game_data;
}

bool GameDataLoader::LoadArchive( const std::filesystem::path& path )
{
	return archive_.LoadArchive( path );
}

const Archive& GameDataLoader::GetArchive() const
{
	return archive_;
}

void GameDataLoader::SetProjectName( const std::string& project_name )
{
	project_name_override_= project_name;
}

std::string GameDataLoader::GetProjectName() const
{
	if( !project_name_override_.empty() )
		return project_name_override_;

	std::filesystem::path path= archive_.GetSourcePath();
	if( !path.empty() && path.filename().empty() ) // Directory with trailing separator.
		path= path.parent_path();

	const std::string stem= path.stem().string();
	if( stem.empty() )
		return g_default_project_name;

	return ToUpper( stem );
}

void GameDataLoader::GetCategoryLumpNames( const DataCategory category, std::vector<std::string>& out_names ) const
{
	const std::string project= GetProjectName();

	switch( category )
	{
	case DataCategory::General:
		out_names= { "general.reld", project + ".GEN", ".GEN" };
		return;
	case DataCategory::Heroes:
		out_names= { "heroes.reld", project + ".HSP", ".DT2", project + ".DT0" };
		return;
	case DataCategory::Enemies:
		out_names= { "enemies.reld", ".DT5" };
		return;
	case DataCategory::Maps:
		out_names= { "maps.reld", project + ".MAP", ".DT6" };
		return;
	case DataCategory::Items:
		out_names= { "items.reld", ".DT3" };
		return;
	case DataCategory::Spells:
		out_names= { "spells.reld", ".DT4" };
		return;
	case DataCategory::Scripts:
		out_names= { "scripts.reld", ".DT7" };
		return;
	case DataCategory::Textures:
		out_names= { "textures.reld", ".DT8" };
		return;
	case DataCategory::Audio:
		out_names= { "audio.reld", ".DT9" };
		return;
	case DataCategory::Saves:
		out_names= { "saves.reld", ".SAV" };
		return;
	};

	RA_ASSERT(false);
	out_names.clear();
}

const LumpData* GameDataLoader::FindCategoryLump( const DataCategory category, std::string* const out_lump_name ) const
{
	std::vector<std::string> names;
	GetCategoryLumpNames( category, names );

	for( const std::string& name : names )
	{
		const LumpData* const data= archive_.GetLump( name );
		if( data != nullptr )
		{
			if( out_lump_name != nullptr )
				*out_lump_name= name;
			return data;
		}
	}

	return nullptr;
}

template<class Func>
bool GameDataLoader::LoadCategory( const DataCategory category, const Func& decode ) const
{
	std::string lump_name;
	const LumpData* const data= FindCategoryLump( category, &lump_name );
	if( data == nullptr )
	{
		Log::Info( "No ", DataCategoryName( category ), " data in archive" );
		return false;
	}

	Log::Info( "Loading ", DataCategoryName( category ), " from \"", lump_name, "\", ", data->size(), " bytes" );
	decode( *data );
	return true;
}

bool GameDataLoader::LoadGeneralData( GeneralData& out_general ) const
{
	return LoadCategory( DataCategory::General, [&]( const LumpData& data ){ DecodeGeneralData( data, out_general ); } );
}

bool GameDataLoader::LoadHeroData( std::vector<HeroData>& out_heroes ) const
{
	return LoadCategory( DataCategory::Heroes, [&]( const LumpData& data ){ DecodeHeroData( data, out_heroes ); } );
}

bool GameDataLoader::LoadEnemyData( std::vector<EnemyData>& out_enemies ) const
{
	return LoadCategory( DataCategory::Enemies, [&]( const LumpData& data ){ DecodeEnemyData( data, out_enemies ); } );
}

bool GameDataLoader::LoadMapData( std::vector<MapData>& out_maps ) const
{
	return LoadCategory( DataCategory::Maps, [&]( const LumpData& data ){ DecodeMapData( data, out_maps ); } );
}

bool GameDataLoader::LoadItemData( std::vector<ItemData>& out_items ) const
{
	return LoadCategory( DataCategory::Items, [&]( const LumpData& data ){ DecodeItemData( data, out_items ); } );
}

bool GameDataLoader::LoadSpellData( std::vector<SpellData>& out_spells ) const
{
	return LoadCategory( DataCategory::Spells, [&]( const LumpData& data ){ DecodeSpellData( data, out_spells ); } );
}

bool GameDataLoader::LoadScriptData( std::vector<ScriptData>& out_scripts ) const
{
	return LoadCategory( DataCategory::Scripts, [&]( const LumpData& data ){ DecodeScriptData( data, out_scripts ); } );
}

bool GameDataLoader::LoadTextureData( std::vector<TextureData>& out_textures ) const
{
	return LoadCategory( DataCategory::Textures, [&]( const LumpData& data ){ DecodeTextureData( data, out_textures ); } );
}

bool GameDataLoader::LoadAudioData( std::vector<AudioData>& out_audio ) const
{
	return LoadCategory( DataCategory::Audio, [&]( const LumpData& data ){ DecodeAudioData( data, out_audio ); } );
}

bool GameDataLoader::LoadSaveData( std::vector<SaveData>& out_saves ) const
{
	return LoadCategory( DataCategory::Saves, [&]( const LumpData& data ){ DecodeSaveData( data, out_saves ); } );
}

void GameDataLoader::GetTilesetLumpNames( const int tileset_id, std::vector<std::string>& out_names ) const
{
	out_names.clear();

	const char* const formats[]= { "%03d", "%02d", "%d" };
	for( const char* const format : formats )
	{
		char id_str[16];
		std::snprintf( id_str, sizeof(id_str), format, tileset_id );
		out_names.push_back( std::string(g_tileset_lump_prefix) + id_str + g_tileset_lump_extension );
	}

	for( unsigned int i= 0u, lower_case_count= static_cast<unsigned int>( out_names.size() ); i < lower_case_count; i++ )
		out_names.push_back( ToUpper( out_names[i] ) );
}

bool GameDataLoader::LoadTilesetData( const int tileset_id, TilesetData& out_tileset ) const
{
	std::vector<std::string> names;
	GetTilesetLumpNames( tileset_id, names );

	for( const std::string& name : names )
	{
		const LumpData* const data= archive_.GetLump( name );
		if( data == nullptr )
			continue;

		Log::Info( "Loading tileset ", tileset_id, " from \"", name, "\", ", data->size(), " bytes" );
		if( !DecodeTilesetData( *data, out_tileset ) )
			return false;

		out_tileset.id= tileset_id;
		return true;
	}

	Log::Info( "Tileset ", tileset_id, " not found" );
	return false;
}

bool GameDataLoader::IsTilesetAvailable( const int tileset_id ) const
{
	std::vector<std::string> names;
	GetTilesetLumpNames( tileset_id, names );

	for( const std::string& name : names )
	{
		if( archive_.HasLump( name ) )
			return true;
	}

	return false;
}

void GameDataLoader::GetAvailableTilesetIds( std::vector<int>& out_ids ) const
{
	std::vector<std::string> lump_names;
	archive_.GetLumpNames( lump_names );

	const std::string prefix= g_tileset_lump_prefix;
	const std::string extension= g_tileset_lump_extension;

	std::set<int> ids;
	for( const std::string& lump_name : lump_names )
	{
		const std::string name= ToLower( lump_name );
		if( !( name.size() > prefix.size() + extension.size() && StartsWith( name, prefix ) && EndsWith( name, extension ) ) )
			continue;

		const std::string digits= name.substr( prefix.size(), name.size() - prefix.size() - extension.size() );
		if( digits.size() > g_max_tileset_id_digits )
			continue;

		bool all_digits= true;
		for( const char c : digits )
			all_digits= all_digits && std::isdigit( static_cast<unsigned char>(c) ) != 0;

		if( !all_digits )
			continue;

		// Accept only names, which LoadTilesetData can find, like "tileset01.rgfx", but not "Tileset1.rgfx" or "tileset0001.rgfx".
		const int tileset_id= std::stoi( digits );
		if( IsTilesetAvailable( tileset_id ) )
			ids.insert( tileset_id );
	}

	out_ids.assign( ids.begin(), ids.end() );
}

} // namespace RpgArchive
