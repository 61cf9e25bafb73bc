#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "fwd.hpp"

namespace RpgArchive
{

// Named binary chunks of one loaded archive.
// Names are unique, last "Put" wins. Not thread-safe.
class LumpStore final
{
public:
	LumpStore();
	~LumpStore();

	void Put( const std::string& name, LumpData data );

	// Returns nullptr, if lump does not exist.
	const LumpData* Get( const std::string& name ) const;

	// Lump content as UTF-8 text. Returns false, if lump does not exist.
	bool GetAsText( const std::string& name, std::string& out_text ) const;

	bool Has( const std::string& name ) const;

	// Order of names is not specified.
	void GetNames( std::vector<std::string>& out_names ) const;

	// Returns 0 for nonexistent lumps.
	unsigned int GetSize( const std::string& name ) const;
	unsigned int GetCount() const;

	void Clear();

private:
	LumpStore( const LumpStore& )= delete;
	LumpStore& operator=( const LumpStore& )= delete;

private:
	std::unordered_map< std::string, LumpData > lumps_;
};

} // namespace RpgArchive
