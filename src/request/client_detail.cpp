#include "request/client_detail.hpp"

namespace reqkeep::request
{
    outcome::result<void> encodeClientDetail( const ClientDetail &detail, codec::ByteWriter &writer )
    {
        writer.writeUint64( ClientDetail::kMagic );
        writer.writeUint32( ClientDetail::kVersion );
        OUTCOME_TRY( detail.identity.writeTo( writer ) );
        writer.writeBool( detail.realtime );
        writer.writeInt32( detail.verbosity );
        writer.writeInt64( detail.startup_time );
        writer.writeInt16( detail.priority_class );
        OUTCOME_TRY( writer.writeOptionalUtf( detail.client_token ) );
        writer.writeBool( detail.finished );
        return outcome::success();
    }

    outcome::result<ClientDetail> decodeClientDetail( codec::ByteReader &reader, const RequestIdentity &expected )
    {
        OUTCOME_TRY( auto magic, reader.readUint64() );
        if ( magic != ClientDetail::kMagic )
        {
            return codec::DecodeError::BAD_MAGIC;
        }
        OUTCOME_TRY( auto version, reader.readUint32() );
        if ( version != ClientDetail::kVersion )
        {
            return codec::DecodeError::BAD_VERSION;
        }
        OUTCOME_TRY( auto identity, RequestIdentity::readFrom( reader ) );
        if ( identity != expected )
        {
            return codec::DecodeError::IDENTITY_MISMATCH;
        }

        ClientDetail detail{ std::move( identity ) };
        OUTCOME_TRY( auto realtime, reader.readBool() );
        OUTCOME_TRY( auto verbosity, reader.readInt32() );
        OUTCOME_TRY( auto startup_time, reader.readInt64() );
        OUTCOME_TRY( auto priority_class, reader.readInt16() );
        if ( !priority::isValid( priority_class ) )
        {
            return codec::DecodeError::BOGUS_PRIORITY;
        }
        OUTCOME_TRY( auto client_token, reader.readOptionalUtf() );
        OUTCOME_TRY( auto finished, reader.readBool() );

        detail.realtime       = realtime;
        detail.verbosity      = verbosity;
        detail.startup_time   = startup_time;
        detail.priority_class = priority_class;
        detail.client_token   = std::move( client_token );
        detail.finished       = finished;
        return detail;
    }
}
