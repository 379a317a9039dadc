#include "semroute/backend/backend_guard.hpp"

#include <asio/error.hpp>
#include <asio/system_error.hpp>

#include <string>

namespace semroute {

asio::awaitable<GuardedProbe> guarded_probe(std::shared_ptr<IBackendClient> client) {
    try {
        auto result = co_await client->async_probe();
        co_return GuardedProbe{std::move(result), nullptr};
    } catch (const asio::system_error& e) {
        if (e.code() == asio::error::operation_aborted) {
            co_return GuardedProbe{tl::unexpected(BackendError::cancelled()), nullptr};
        }
        // Transport failure: an ordinary unhealthy observation
        co_return GuardedProbe{tl::unexpected(BackendError::connection(e.what())), nullptr};
    } catch (const std::exception& e) {
        co_return GuardedProbe{
            tl::unexpected(BackendError::application(std::string("probe threw: ") + e.what())),
            std::current_exception()
        };
    } catch (...) {
        co_return GuardedProbe{
            tl::unexpected(BackendError::application("probe threw a non-standard exception")),
            std::current_exception()
        };
    }
}

asio::awaitable<BackendResult<BackendResponse>> guarded_call(
    std::shared_ptr<IBackendClient> client,
    BackendRequest request
) {
    try {
        co_return co_await client->async_call(std::move(request));
    } catch (const asio::system_error& e) {
        if (e.code() == asio::error::operation_aborted) {
            co_return tl::unexpected(BackendError::cancelled());
        }
        co_return tl::unexpected(BackendError::connection(e.what()));
    } catch (const std::exception& e) {
        co_return tl::unexpected(BackendError::application(std::string("backend threw: ") + e.what()));
    } catch (...) {
        co_return tl::unexpected(BackendError::application("backend threw a non-standard exception"));
    }
}

}  // namespace semroute
