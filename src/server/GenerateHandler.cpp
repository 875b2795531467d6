/**
 * @file GenerateHandler.cpp
 * @brief Transport-independent handling of /generate-stl requests
 */

#include "GenerateHandler.hpp"

namespace keyforge {

GenerateHandler::GenerateHandler(const KeychainGenerator& generator)
    : generator_(generator),
      decoder_(generator.get_config().default_font),
      logger_("GenerateHandler") {
}

HttpReply GenerateHandler::handle(const std::string& body) const {
    try {
        const GenerationRequest request = decoder_.decode(body);
        return ResponseAssembler::from_result(generator_.generate(request));
    } catch (const GenerationError& e) {
        logger_.info(std::string("Rejected request (") + failure_kind_name(e.kind()) + "): " + e.what());
        return ResponseAssembler::from_failure(RenderFailure{e.kind(), e.what()});
    } catch (const std::exception& e) {
        logger_.error(std::string("Unhandled error: ") + e.what());
        return ResponseAssembler::from_failure(
            RenderFailure{FailureKind::UnhandledFault, "Unexpected internal error"});
    }
}

} // namespace keyforge
