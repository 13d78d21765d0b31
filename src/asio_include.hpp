#ifndef POKEWIRE_ASIO_INCLUDE_HPP
#define POKEWIRE_ASIO_INCLUDE_HPP

// Unified Asio include
// Standalone Asio when available, Boost.Asio when built with POKEWIRE_USE_BOOST_ASIO

#if defined(POKEWIRE_USE_BOOST_ASIO)
    #include <utility>
    #include <boost/asio.hpp>
    #include <boost/system/error_code.hpp>
    namespace asio = boost::asio;

    namespace pokewire {
    namespace internal {
    using AsioErrorCode = boost::system::error_code;
    } // namespace internal
    } // namespace pokewire
#else
    #ifndef ASIO_STANDALONE
        #define ASIO_STANDALONE
    #endif
    #include <asio.hpp>

    namespace pokewire {
    namespace internal {
    using AsioErrorCode = asio::error_code;
    } // namespace internal
    } // namespace pokewire
#endif

#endif // POKEWIRE_ASIO_INCLUDE_HPP
