#ifndef GATEWAY_ERROR_H
#define GATEWAY_ERROR_H

#include <stdexcept>
#include <string>
#include "kernel/ActionTypes.h"

// Failure talking to an external collaborator (content service, language
// backend, recommender).
class GatewayError : public std::runtime_error {
public:
    enum class Kind { Timeout, Transport, ServerError, ClientError, Malformed };

    GatewayError(Kind kind, const std::string& what, long httpStatus = 0)
        : std::runtime_error(what), kind_(kind), httpStatus_(httpStatus) {}

    Kind kind() const { return kind_; }
    long httpStatus() const { return httpStatus_; }

    // Timeouts, transport failures and 5xx may succeed on a later attempt.
    bool transient() const {
        return kind_ == Kind::Timeout || kind_ == Kind::Transport || kind_ == Kind::ServerError;
    }

    FailureCause cause() const {
        switch (kind_) {
            case Kind::Timeout: return FailureCause::Timeout;
            case Kind::Transport: return FailureCause::Transport;
            case Kind::ServerError: return FailureCause::ServerError;
            case Kind::ClientError: return FailureCause::ClientError;
            case Kind::Malformed: return FailureCause::MalformedResponse;
        }
        return FailureCause::Internal;
    }

private:
    Kind kind_;
    long httpStatus_;
};

#endif
