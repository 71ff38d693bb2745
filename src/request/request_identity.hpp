#ifndef REQKEEP_REQUEST_REQUEST_IDENTITY_HPP
#define REQKEEP_REQUEST_REQUEST_IDENTITY_HPP

#include <cstdint>
#include <ostream>
#include <string>

#include <boost/optional.hpp>

#include "codec/byte_stream.hpp"
#include "outcome/outcome.hpp"

namespace reqkeep::request
{
    enum class RequestKind : uint16_t
    {
        GET = 0,
        PUT = 1,
    };

    std::string toString( RequestKind kind );

    /**
     * Names a request within its queue. It is the join key between the
     * in-memory record, its durable form and the engine state.
     */
    class RequestIdentity
    {
    public:
        /**
         * @param shared - request is on the shared queue
         * @param client_name - must be absent exactly when shared is true
         * @return identity or INVALID_IDENTITY
         */
        static outcome::result<RequestIdentity> create( bool                                shared,
                                                        const boost::optional<std::string> &client_name,
                                                        std::string                         identifier,
                                                        RequestKind                         kind );

        static RequestIdentity onSharedQueue( std::string identifier, RequestKind kind );

        static RequestIdentity forClient( std::string client_name, std::string identifier, RequestKind kind );

        [[nodiscard]] bool isShared() const
        {
            return shared_;
        }

        [[nodiscard]] const boost::optional<std::string> &clientName() const
        {
            return client_name_;
        }

        [[nodiscard]] const std::string &identifier() const
        {
            return identifier_;
        }

        [[nodiscard]] RequestKind kind() const
        {
            return kind_;
        }

        outcome::result<void> writeTo( codec::ByteWriter &writer ) const;

        static outcome::result<RequestIdentity> readFrom( codec::ByteReader &reader );

        [[nodiscard]] std::string toString() const;

        bool operator==( const RequestIdentity &other ) const;
        bool operator!=( const RequestIdentity &other ) const;
        bool operator<( const RequestIdentity &other ) const;

    private:
        RequestIdentity( bool shared, boost::optional<std::string> client_name, std::string identifier, RequestKind kind );

        bool                         shared_;
        boost::optional<std::string> client_name_;
        std::string                  identifier_;
        RequestKind                  kind_;
    };

    inline std::ostream &operator<<( std::ostream &out, const RequestIdentity &identity )
    {
        return out << identity.toString();
    }
}

#endif // REQKEEP_REQUEST_REQUEST_IDENTITY_HPP
