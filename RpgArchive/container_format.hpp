#pragma once
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "assert.hpp"
#include "fwd.hpp"

namespace RpgArchive
{

enum class ContainerKind
{
	None, // Path does not exist or can not be read.
	Directory,
	Modern,
	Legacy,
};

const char* ContainerKindName( ContainerKind kind );

constexpr char c_modern_container_magic[4]= { 'R', 'P', 'G', '!' };
constexpr unsigned int c_modern_container_lump_name_size= 32u;

#pragma pack(push, 1)

struct ModernContainerHeader
{
	char magic[4];
	int32_t version;
	int32_t lump_count;
	int32_t directory_size; // Not interpreted.
};

SIZE_ASSERT( ModernContainerHeader, 16 );

struct ModernContainerEntryPacked
{
	char name[ c_modern_container_lump_name_size ]; // Null-padded.
	int32_t offset;
	int32_t size;
	int32_t flags;
};

SIZE_ASSERT( ModernContainerEntryPacked, 44 );

#pragma pack(pop)

// Directory of modern container, as it stored in file.
// Directory placed right after header.
struct ModernContainerDirectory
{
	struct Entry
	{
		std::string name;
		int32_t offset= 0;
		int32_t size= 0;
		int32_t flags= 0;
	};

	int32_t version= 1;
	int32_t directory_size= 0;
	std::vector<Entry> entries;
};

// Decides container kind by path type and first bytes of file.
ContainerKind DetectContainerKind( const std::filesystem::path& path );

// Each regular file under root becomes lump with root-relative name, separated by '/'.
// Returns false if any file can not be enumerated or read.
bool ReadDirectoryTree( const std::filesystem::path& root, LumpStore& out_store );

// Returns false on any corruption. Lumps already placed into store are not removed.
bool ReadModernContainer( const std::filesystem::path& file_path, LumpStore& out_store, ModernContainerDirectory& out_directory );

// Reads lumps until end or first inconsistency. Never fails.
// Returns number of lumps read.
unsigned int ReadLegacyContainer( const LumpData& content, LumpStore& out_store );

// Places given lumps contiguously right after directory.
ModernContainerDirectory BuildModernContainerDirectory(
	const std::vector<std::string>& lump_names,
	const LumpStore& store,
	int32_t version= 1 );

// Writes header, directory and lumps at offsets from directory. Gaps are filled with zeros.
// Returns false if directory is inconsistent with store (lump missing, size mismatch, overlapping with header).
bool SerializeModernContainer( const ModernContainerDirectory& directory, const LumpStore& store, LumpData& out_bytes );

void SerializeLegacyContainer( const std::vector<std::string>& lump_names, const LumpStore& store, LumpData& out_bytes );

} // namespace RpgArchive
