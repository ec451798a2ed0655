#ifndef NATDEV_DRAIN_HEADER
#define NATDEV_DRAIN_HEADER

#include "error.hpp"
#include "detail/drain_op.hpp"

#include <array>
#include <cstddef>
#include <limits>
#include <type_traits>
#include <vector>

#include <asio/async_result.hpp>
#include <asio/buffer.hpp>
#include <asio/error.hpp>

namespace natdev {

constexpr std::size_t unlimited_size = std::numeric_limits<std::size_t>::max();

/**
 * @brief Reads @p stream until end of stream and returns everything that was
 * read.
 *
 * End of stream is either a `read_some` call that yields zero bytes or one
 * that reports `asio::error::eof`. The source may return its data in chunks of
 * any size.
 *
 * @param stream A SyncReadStream.
 *
 * @param error Set to indicate what error occurred, if any. A read error other
 * than end of stream is reported here, as is `asio::error::message_size` if the
 * stream holds more than @p max_size bytes.
 *
 * @param max_size The largest number of bytes the caller is willing to buffer.
 * No limit is imposed by default, so callers reading from untrusted sources
 * must bound them.
 *
 * @return The bytes read before end of stream or before the error occurred.
 */
template<typename SyncReadStream>
std::vector<unsigned char> drain_to_end(SyncReadStream& stream,
        error_code& error, std::size_t max_size = unlimited_size)
{
    error = error_code();
    std::vector<unsigned char> data;
    std::array<unsigned char, detail::drain_chunk_size> chunk;
    while(true) {
        error_code read_error;
        const auto num_read = stream.read_some(asio::buffer(chunk), read_error);
        detail::append_chunk(data, chunk.data(), num_read, max_size, error);
        if(error) {
            break;
        }
        if(read_error == asio::error::eof || (!read_error && num_read == 0)) {
            break;
        }
        if(read_error) {
            error = read_error;
            break;
        }
    }
    return data;
}

/**
 * @brief Reads @p stream until end of stream without blocking the caller.
 *
 * Has the same end of stream, error and @p max_size semantics as
 * @ref drain_to_end.
 *
 * @param stream An AsyncReadStream. It must outlive the operation.
 *
 * @param handler The handler to be called when the stream has been drained.
 * The function signature of the handler must be:
 * @code void handler(
 *   natdev::error_code, // The result of the operation.
 *   std::vector<unsigned char> // Everything that was read.
 * ); @endcode
 */
template<typename AsyncReadStream, typename Handler>
ASIO_INITFN_RESULT_TYPE(Handler, void(error_code, std::vector<unsigned char>))
async_drain_to_end(AsyncReadStream& stream, Handler handler,
        std::size_t max_size = unlimited_size)
{
    asio::async_completion<Handler,
            void(error_code, std::vector<unsigned char>)> init(handler);
    using handler_type = typename std::decay<
            decltype(init.completion_handler)>::type;
    detail::drain_op<AsyncReadStream, handler_type>(stream, max_size,
            std::move(init.completion_handler)).start();
    return init.result.get();
}

} // natdev

#endif // NATDEV_DRAIN_HEADER
