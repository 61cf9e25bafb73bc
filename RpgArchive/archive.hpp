#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "container_format.hpp"
#include "fwd.hpp"
#include "lump_store.hpp"

namespace RpgArchive
{

// Loading session of one game archive - directory tree, or lumped file.
// Owns all lumps. Not thread-safe, caller must serialize all calls.
class Archive final
{
public:
	Archive();
	~Archive();

	// Clears previous state, than loads new archive.
	// Returns false, if path is not an archive, or archive is broken. Never throws.
	bool LoadArchive( const std::filesystem::path& path );
	void Dispose();

	bool IsLoaded() const;
	ContainerKind GetContainerKind() const;
	const std::filesystem::path& GetSourcePath() const;

	// Directory of loaded modern container. Empty for other containers.
	const ModernContainerDirectory& GetModernDirectory() const;

	const LumpStore& GetLumps() const;

	// Returns nullptr, if lump does not exist.
	const LumpData* GetLump( const std::string& name ) const;
	bool GetLumpAsText( const std::string& name, std::string& out_text ) const;
	bool HasLump( const std::string& name ) const;
	void GetLumpNames( std::vector<std::string>& out_names ) const;
	unsigned int GetLumpSize( const std::string& name ) const;
	unsigned int GetLumpCount() const;

private:
	Archive( const Archive& )= delete;
	Archive& operator=( const Archive& )= delete;

	bool LoadArchiveImpl( const std::filesystem::path& path );

private:
	std::filesystem::path source_path_;
	bool loaded_= false;
	ContainerKind container_kind_= ContainerKind::None;
	ModernContainerDirectory modern_directory_;
	LumpStore lumps_;
};

} // namespace RpgArchive
