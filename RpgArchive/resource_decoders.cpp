#include "decoder_common.hpp"
#include "reld.hpp"

#include "record_decoders.hpp"

namespace RpgArchive
{

namespace
{

enum ScriptConstantKind : int32_t
{
	ScriptConstantString= 0,
	ScriptConstantInt= 1,
	ScriptConstantFloat= 2,
};

void DecodeReldScript( LoadStream& stream, ScriptData& script )
{
	script.id= ReadInt32Value( stream );
	stream.ReadFixedString( c_fixed_name_size, script.name );
	script.script_type= ReadInt32Value( stream );

	stream.ReadSizedBytes( script.bytecode );

	const unsigned int constants_count= stream.ReadCount( sizeof(int32_t) );
	script.constants.resize( constants_count );
	for( ScriptData::Constant& constant : script.constants )
	{
		switch( ReadInt32Value( stream ) )
		{
		case ScriptConstantString:
			constant.kind= ScriptData::Constant::Kind::String;
			stream.ReadSizedString( constant.string_value );
			break;
		case ScriptConstantInt:
			constant.kind= ScriptData::Constant::Kind::Int;
			constant.int_value= ReadInt32Value( stream );
			break;
		case ScriptConstantFloat:
			constant.kind= ScriptData::Constant::Kind::Float;
			stream.ReadFloat( constant.float_value );
			break;
		default:
			constant.kind= ScriptData::Constant::Kind::None;
			break;
		};
	}

	const unsigned int labels_count= stream.ReadCount( c_fixed_name_size + sizeof(int32_t) );
	for( unsigned int i= 0u; i < labels_count; i++ )
	{
		std::string label_name;
		stream.ReadFixedString( c_fixed_name_size, label_name );
		script.labels[ std::move(label_name) ]= ReadInt32Value( stream );
	}
}

// Legacy scripts contain only header, bytecode is stored elsewhere.
void DecodeLegacyScript( LoadStream& stream, ScriptData& script )
{
	script.id= ReadInt32Value( stream );
	stream.ReadFixedString( c_fixed_name_size, script.name );
	script.script_type= ReadInt32Value( stream );
}

void DecodeReldTexture( LoadStream& stream, TextureData& texture )
{
	texture.id= ReadInt32Value( stream );
	stream.ReadFixedString( c_fixed_name_size, texture.name );
	texture.width= ReadInt32Value( stream );
	texture.height= ReadInt32Value( stream );
	texture.format= ReadInt32Value( stream );
	texture.palette= ReadInt32Value( stream );

	stream.ReadSizedBytes( texture.pixel_data );
	if( texture.format == TextureData::c_format_indexed )
		stream.ReadSizedBytes( texture.palette_data );

	ReadMetadata( stream, texture.metadata );
}

void DecodeLegacyTexture( LoadStream& stream, TextureData& texture )
{
	texture.id= ReadInt32Value( stream );
	stream.ReadFixedString( c_fixed_name_size, texture.name );
	texture.width= ReadInt16Value( stream );
	texture.height= ReadInt16Value( stream );
	texture.format= ReadInt16Value( stream );
	texture.palette= ReadInt16Value( stream );
}

void ReadAudioHeader( LoadStream& stream, AudioData& audio )
{
	audio.id= ReadInt32Value( stream );
	stream.ReadFixedString( c_fixed_name_size, audio.name );
	audio.audio_type= ReadInt32Value( stream );
	audio.format= ReadInt32Value( stream );
	audio.sample_rate= ReadInt32Value( stream );
	audio.channels= ReadInt32Value( stream );
	audio.bit_depth= ReadInt32Value( stream );
}

void DecodeReldAudio( LoadStream& stream, AudioData& audio )
{
	ReadAudioHeader( stream, audio );
	stream.ReadSizedBytes( audio.data );
	ReadMetadata( stream, audio.metadata );
}

} // namespace

void DecodeScriptData( const LumpData& data, std::vector<ScriptData>& out_scripts )
{
	out_scripts.clear();

	if( IsReldChunk( data ) )
		DecodeReldRecords( data, ReldTag::Script, out_scripts, DecodeReldScript );
	else
		DecodeLegacyRecords( data, c_legacy_script_size, "scripts", out_scripts, DecodeLegacyScript );
}

void DecodeTextureData( const LumpData& data, std::vector<TextureData>& out_textures )
{
	out_textures.clear();

	if( IsReldChunk( data ) )
		DecodeReldRecords( data, ReldTag::Texture, out_textures, DecodeReldTexture );
	else
		DecodeLegacyRecords( data, c_legacy_texture_size, "textures", out_textures, DecodeLegacyTexture );
}

void DecodeAudioData( const LumpData& data, std::vector<AudioData>& out_audio )
{
	out_audio.clear();

	if( IsReldChunk( data ) )
		DecodeReldRecords( data, ReldTag::Audio, out_audio, DecodeReldAudio );
	else
		DecodeLegacyRecords( data, c_legacy_audio_size, "audio", out_audio, ReadAudioHeader );
}

} // namespace RpgArchive
