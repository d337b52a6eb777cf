#include "Core/Net/Tls.hpp"

#include <memory>

namespace Net
{
    boost::asio::ssl::context MakeClientTlsContext()
    {
        boost::asio::ssl::context ctx(boost::asio::ssl::context::tls_client);
        ctx.set_options(boost::asio::ssl::context::default_workarounds |
                        boost::asio::ssl::context::no_sslv2 |
                        boost::asio::ssl::context::no_sslv3 |
                        boost::asio::ssl::context::no_tlsv1 |
                        boost::asio::ssl::context::no_tlsv1_1);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(boost::asio::ssl::verify_peer);
        return ctx;
    }


    boost::beast::error_code Resolve(boost::asio::io_context                      &ioc,
                                     const std::string                            &host,
                                     const std::string                            &port,
                                     const std::stop_token                        &st,
                                     std::chrono::steady_clock::time_point         deadline,
                                     boost::asio::ip::tcp::resolver::results_type &out)
    {
        struct State
        {
            boost::asio::ip::tcp::resolver               resolver;
            boost::asio::ip::tcp::resolver::results_type results;
            boost::beast::error_code                     ec = boost::asio::error::would_block;
            bool                                         done = false;

            explicit State(boost::asio::io_context &ioc) : resolver(ioc) {}
        };
        auto state = std::make_shared<State>(ioc);

        state->resolver.async_resolve(host, port,
                                      [state](boost::beast::error_code ec,
                                              boost::asio::ip::tcp::resolver::results_type r)
                                      {
                                          state->results = std::move(r);
                                          state->ec      = ec;
                                          state->done    = true;
                                      });

        ioc.restart();
        while (!state->done)
        {
            if (st.stop_requested())
            {
                state->resolver.cancel();
                return boost::asio::error::operation_aborted;
            }
            if (std::chrono::steady_clock::now() >= deadline)
            {
                state->resolver.cancel();
                return boost::asio::error::timed_out;
            }
            if (ioc.run_one_for(kCancelSlice) == 0 && ioc.stopped()) break;
        }

        if (!state->done) return boost::asio::error::operation_aborted;
        if (!state->ec) out = std::move(state->results);
        return state->ec;
    }
}
