#include "request/request_identity.hpp"

#include <tuple>

#include "request/request_error.hpp"

namespace reqkeep::request
{
    std::string toString( RequestKind kind )
    {
        switch ( kind )
        {
            case RequestKind::GET:
                return "get";
            case RequestKind::PUT:
                return "put";
        }
        return std::to_string( static_cast<int>( kind ) );
    }

    RequestIdentity::RequestIdentity( bool                         shared,
                                      boost::optional<std::string> client_name,
                                      std::string                  identifier,
                                      RequestKind                  kind ) :
        shared_( shared ), client_name_( std::move( client_name ) ), identifier_( std::move( identifier ) ), kind_( kind )
    {
    }

    outcome::result<RequestIdentity> RequestIdentity::create( bool                                shared,
                                                              const boost::optional<std::string> &client_name,
                                                              std::string                         identifier,
                                                              RequestKind                         kind )
    {
        if ( shared == client_name.has_value() )
        {
            return RequestError::INVALID_IDENTITY;
        }
        return RequestIdentity( shared, client_name, std::move( identifier ), kind );
    }

    RequestIdentity RequestIdentity::onSharedQueue( std::string identifier, RequestKind kind )
    {
        return RequestIdentity( true, boost::none, std::move( identifier ), kind );
    }

    RequestIdentity RequestIdentity::forClient( std::string client_name, std::string identifier, RequestKind kind )
    {
        return RequestIdentity( false, std::move( client_name ), std::move( identifier ), kind );
    }

    outcome::result<void> RequestIdentity::writeTo( codec::ByteWriter &writer ) const
    {
        writer.writeBool( shared_ );
        if ( !shared_ )
        {
            OUTCOME_TRY( writer.writeUtf( *client_name_ ) );
        }
        OUTCOME_TRY( writer.writeUtf( identifier_ ) );
        writer.writeUint16( static_cast<uint16_t>( kind_ ) );
        return outcome::success();
    }

    outcome::result<RequestIdentity> RequestIdentity::readFrom( codec::ByteReader &reader )
    {
        OUTCOME_TRY( auto shared, reader.readBool() );
        boost::optional<std::string> client_name;
        if ( !shared )
        {
            OUTCOME_TRY( auto name, reader.readUtf() );
            client_name = std::move( name );
        }
        OUTCOME_TRY( auto identifier, reader.readUtf() );
        OUTCOME_TRY( auto kind, reader.readUint16() );
        if ( kind > static_cast<uint16_t>( RequestKind::PUT ) )
        {
            return codec::DecodeError::UNKNOWN_REQUEST_KIND;
        }
        return RequestIdentity( shared, std::move( client_name ), std::move( identifier ), static_cast<RequestKind>( kind ) );
    }

    std::string RequestIdentity::toString() const
    {
        std::string queue = shared_ ? std::string( "<shared>" ) : *client_name_;
        return queue + "/" + identifier_ + " (" + request::toString( kind_ ) + ")";
    }

    bool RequestIdentity::operator==( const RequestIdentity &other ) const
    {
        return shared_ == other.shared_ && client_name_ == other.client_name_ && identifier_ == other.identifier_
            && kind_ == other.kind_;
    }

    bool RequestIdentity::operator!=( const RequestIdentity &other ) const
    {
        return !( *this == other );
    }

    bool RequestIdentity::operator<( const RequestIdentity &other ) const
    {
        return std::tie( shared_, client_name_, identifier_, kind_ )
             < std::tie( other.shared_, other.client_name_, other.identifier_, other.kind_ );
    }
}
