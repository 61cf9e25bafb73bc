#pragma once
#include <cstdint>
#include <functional>
#include <string>

#include "fwd.hpp"
#include "load_stream.hpp"

namespace RpgArchive
{

constexpr char c_reld_marker[4]= { 'R', 'E', 'L', 'D' };
constexpr unsigned int c_reld_tag_size= 4u;

// Known RELD blocks.
enum class ReldTag
{
	// General data.
	Title, // "TITL"
	Author, // "AUTH"
	StartMap, // "STMP"
	StartX, // "STX "
	StartY, // "STY "
	StartGold, // "STGL"
	StartHeroes, // "STHR"
	StartItems, // "STIT"

	// Records. Each block contains exactly one record.
	Hero, // "HERO"
	Enemy, // "ENEM"
	Map, // "MAP "
	Item, // "ITEM"
	Spell, // "SPEL"
	Script, // "SCRP"
	Texture, // "TEXT"
	Audio, // "AUDI"
	Save, // "SAVE"

	Unknown,
};

ReldTag ReldTagFromName( const std::string& name );
// Returns 4-symbol name. Empty string for unknown tag.
const char* ReldTagName( ReldTag tag );

struct ReldBlock
{
	ReldTag tag;
	std::string tag_name; // As stored, with trailing nulls removed.
	LoadStream payload; // Covers only block payload.
};

// Returns true, if block was processed.
// Unprocessed blocks just skipped.
typedef std::function< bool( ReldBlock& block ) > ReldBlockHandler;

bool IsReldChunk( const LumpData& data );

// Calls handler for each block of chunk. After each block reading continues right after block end,
// independently of how many bytes handler read.
// Returns chunk version. Throws DecodeError on broken block headers.
int32_t ReadReldBlocks( const LumpData& data, const ReldBlockHandler& handler );

} // namespace RpgArchive
