/**
 * @file GenerateHandler.hpp
 * @brief Transport-independent handling of /generate-stl requests
 */

#pragma once

#include "keychain_generator.hpp"
#include "Logger.hpp"
#include "RequestDecoder.hpp"
#include "ResponseAssembler.hpp"
#include <string>

namespace keyforge {

/**
 * @brief Request body in, HTTP reply out
 *
 * Outermost error boundary of the service: decoding failures become their
 * failure kind, anything else unexpected becomes UnhandledFault.
 */
class GenerateHandler {
public:
    explicit GenerateHandler(const KeychainGenerator& generator);

    /**
     * @brief Handle one request body; never throws
     */
    HttpReply handle(const std::string& body) const;

private:
    const KeychainGenerator& generator_;
    RequestDecoder decoder_;
    Logger logger_;
};

} // namespace keyforge
