#ifndef NATDEV_DRAIN_OP_HEADER
#define NATDEV_DRAIN_OP_HEADER

#include "../error.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include <asio/associated_allocator.hpp>
#include <asio/associated_executor.hpp>
#include <asio/buffer.hpp>
#include <asio/error.hpp>

namespace natdev {
namespace detail {

constexpr std::size_t drain_chunk_size = 1024;

/**
 * Appends @p num_read bytes of @p chunk to @p data, unless that would make it
 * larger than @p max_size, in which case `error` is set.
 */
inline void append_chunk(std::vector<unsigned char>& data,
        const unsigned char* chunk, std::size_t num_read,
        std::size_t max_size, error_code& error)
{
    if(num_read > max_size - data.size()) {
        error = make_error_code(asio::error::message_size);
        return;
    }
    data.insert(data.end(), chunk, chunk + num_read);
}

/**
 * The composed operation behind `async_drain_to_end`. Keeps issuing
 * `async_read_some` on the stream until it reports end of stream.
 *
 * It is associated with the executor and allocator of its handler, so each
 * step runs where the handler would.
 */
template<typename AsyncReadStream, typename Handler>
class drain_op
{
    struct state
    {
        std::array<unsigned char, drain_chunk_size> chunk;
        std::vector<unsigned char> data;
    };

    AsyncReadStream& stream_;
    std::size_t max_size_;
    std::unique_ptr<state> state_;
    Handler handler_;

public:
    drain_op(AsyncReadStream& stream, std::size_t max_size, Handler handler)
        : stream_(stream)
        , max_size_(max_size)
        , state_(std::make_unique<state>())
        , handler_(std::move(handler))
    {}

    drain_op(drain_op&&) = default;

    void start()
    {
        read_some();
    }

    const Handler& handler() const noexcept { return handler_; }

    void operator()(error_code error, std::size_t num_read)
    {
        if(num_read > 0) {
            error_code append_error;
            append_chunk(state_->data, state_->chunk.data(), num_read,
                    max_size_, append_error);
            if(append_error) {
                complete(append_error);
                return;
            }
        }

        if(error == asio::error::eof) {
            complete({});
        } else if(error) {
            complete(error);
        } else if(num_read == 0) {
            // A source that returns nothing without an error has been
            // exhausted.
            complete({});
        } else {
            read_some();
        }
    }

private:
    void read_some()
    {
        auto buffer = asio::buffer(state_->chunk);
        stream_.async_read_some(buffer, std::move(*this));
    }

    void complete(error_code error)
    {
        auto data = std::move(state_->data);
        state_.reset();
        handler_(error, std::move(data));
    }
};

} // detail
} // natdev

namespace asio {

template<typename AsyncReadStream, typename Handler, typename Executor>
struct associated_executor<
        natdev::detail::drain_op<AsyncReadStream, Handler>, Executor>
{
    using type = typename associated_executor<Handler, Executor>::type;

    static type get(const natdev::detail::drain_op<AsyncReadStream, Handler>& op,
            const Executor& executor = Executor()) noexcept
    {
        return associated_executor<Handler, Executor>::get(op.handler(), executor);
    }
};

template<typename AsyncReadStream, typename Handler, typename Allocator>
struct associated_allocator<
        natdev::detail::drain_op<AsyncReadStream, Handler>, Allocator>
{
    using type = typename associated_allocator<Handler, Allocator>::type;

    static type get(const natdev::detail::drain_op<AsyncReadStream, Handler>& op,
            const Allocator& allocator = Allocator()) noexcept
    {
        return associated_allocator<Handler, Allocator>::get(op.handler(), allocator);
    }
};

} // asio

#endif // NATDEV_DRAIN_OP_HEADER
