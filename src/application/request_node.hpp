#ifndef REQKEEP_APPLICATION_REQUEST_NODE_HPP
#define REQKEEP_APPLICATION_REQUEST_NODE_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "application/node_config.hpp"
#include "base/logger.hpp"
#include "client/client_registry.hpp"
#include "client/connection_session.hpp"
#include "jobs/asio_executor.hpp"
#include "jobs/serial_job_runner.hpp"
#include "persistence/request_store.hpp"
#include "request/engine.hpp"
#include "request/request_context.hpp"
#include "storage/buffer_map_types.hpp"

namespace reqkeep::application
{
    /**
     * @brief Wires the request manager of a node: registries, durable store,
     * job runner and executor around an external engine
     */
    class RequestNode
    {
    public:
        /**
         * @param engine - fetch and insert engine
         * @param backend - durable storage, opened from the config if null
         * @param system_clock - clock stamping requests, the real one if null
         */
        static outcome::result<std::unique_ptr<RequestNode>> create( const NodeConfig                        &config,
                                                                     std::shared_ptr<request::RequestEngine>  engine,
                                                                     std::shared_ptr<storage::BufferStorage>  backend      = nullptr,
                                                                     std::shared_ptr<clock::SystemClock>      system_clock = nullptr );

        ~RequestNode();

        /**
         * @brief Resumes the stored requests and starts the job runner
         */
        persistence::ResumeReport start();

        /**
         * @brief Flushes every request, drains the job runner with a final
         * checkpoint and stops the executor
         */
        void shutdown();

        std::shared_ptr<client::ConnectionSession> openSession(
            std::string                                   name,
            std::shared_ptr<client::RequestEventListener> listener = nullptr );

        request::RequestContext &context()
        {
            return ctx_;
        }

        const std::shared_ptr<client::ClientRegistry> &persistentRoot() const
        {
            return persistent_root_;
        }

        const std::shared_ptr<client::ClientRegistry> &rebootRoot() const
        {
            return reboot_root_;
        }

        const std::shared_ptr<jobs::SerialJobRunner> &jobRunner() const
        {
            return job_runner_;
        }

    private:
        RequestNode() = default;

        std::shared_ptr<storage::BufferStorage>  storage_;
        std::shared_ptr<client::ClientRegistry>  persistent_root_;
        std::shared_ptr<client::ClientRegistry>  reboot_root_;
        std::shared_ptr<persistence::RequestStore> store_;
        std::shared_ptr<jobs::SerialJobRunner>   job_runner_;
        std::shared_ptr<jobs::AsioExecutor>      executor_;
        request::RequestContext                  ctx_;

        std::mutex                                            mutex_;
        std::vector<std::weak_ptr<client::ConnectionSession>> sessions_;
        bool                                                  stopped_ = false;

        base::Logger logger_ = base::createLogger( "RequestNode" );
    };
}

#endif // REQKEEP_APPLICATION_REQUEST_NODE_HPP
