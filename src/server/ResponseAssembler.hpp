/**
 * @file ResponseAssembler.hpp
 * @brief Maps pipeline results onto HTTP replies
 */

#pragma once

#include "keychain_generator.hpp"
#include <map>
#include <string>

namespace keyforge {

/**
 * @brief Transport-neutral HTTP reply
 */
struct HttpReply {
    int status = 200;
    std::string content_type;
    std::string body;
    std::map<std::string, std::string> headers;
};

/// MIME type of STL attachments
inline constexpr const char* kMeshContentType = "application/sla";

class ResponseAssembler {
public:
    /**
     * @brief Attachment reply on success, JSON error reply otherwise
     */
    static HttpReply from_result(const GenerationResult& result);

    /**
     * @brief JSON error reply: {"error", "kind", "details"?}
     *
     * Status is 400 for client errors and 500 otherwise. Server-side kinds
     * whose detail may reveal deployment internals get a fixed message.
     */
    static HttpReply from_failure(const RenderFailure& failure);

    static HttpReply health();

    static int status_for(FailureKind kind);

private:
    static HttpReply json_reply(int status, const std::string& body);
};

} // namespace keyforge
