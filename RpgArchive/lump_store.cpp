#include "lump_store.hpp"

namespace RpgArchive
{

LumpStore::LumpStore()
{}

LumpStore::~LumpStore()
{}

void LumpStore::Put( const std::string& name, LumpData data )
{
	lumps_[name]= std::move(data);
}

const LumpData* LumpStore::Get( const std::string& name ) const
{
	const auto it= lumps_.find( name );
	if( it == lumps_.end() )
		return nullptr;

	return &it->second;
}

bool LumpStore::GetAsText( const std::string& name, std::string& out_text ) const
{
	const LumpData* const data= Get( name );
	if( data == nullptr )
		return false;

	out_text.assign( reinterpret_cast<const char*>( data->data() ), data->size() );
	return true;
}

bool LumpStore::Has( const std::string& name ) const
{
	return lumps_.find( name ) != lumps_.end();
}

void LumpStore::GetNames( std::vector<std::string>& out_names ) const
{
	out_names.reserve( out_names.size() + lumps_.size() );
	for( const auto& lump : lumps_ )
		out_names.push_back( lump.first );
}

unsigned int LumpStore::GetSize( const std::string& name ) const
{
	const LumpData* const data= Get( name );
	return data == nullptr ? 0u : static_cast<unsigned int>( data->size() );
}

unsigned int LumpStore::GetCount() const
{
	return static_cast<unsigned int>( lumps_.size() );
}

void LumpStore::Clear()
{
	lumps_.clear();
}

} // namespace RpgArchive
