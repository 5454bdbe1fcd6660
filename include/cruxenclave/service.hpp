#ifndef CRUXENCLAVE_SERVICE_HPP
#define CRUXENCLAVE_SERVICE_HPP

#include "codec.hpp"
#include "enclave.hpp"

#include <optional>
#include <string>
#include <vector>

namespace CruxEnclave {

    // Outcome carried in a RESPONSE frame.
    enum class Status : uint8_t {
        Ok = 0,
        UnknownSender = 1,
        NotFound = 2,
        UnsealError = 3,
        BadRequest = 4,
        InternalError = 5
    };

    /**
     * @brief A decoded RESPONSE frame.
     * Body format: [RequestId (4)] + [Status (1)] + [Result (bytes)]
     * On failure the result holds the error message.
     */
    struct Response {
        uint32_t request_id = 0;
        Status status = Status::Ok;
        byte_vector result;

        Frame to_frame() const;
        static Response from_frame(const Frame& frame);
    };

    /**
     * @brief Request builders for the node's request op-codes.
     * Each request body starts with a u32 request id.
     */
    namespace Requests {
        Frame store(uint32_t request_id, const byte_vector& message, const std::string& sender,
                    const std::vector<std::string>& recipients);
        Frame retrieve(uint32_t request_id, const Digest& digest);
        Frame remove(uint32_t request_id, const Digest& digest);
    }

    /**
     * @brief Dispatches transport frames to an Enclave.
     *
     * PUSH_PAYLOAD and PARTY_INFO are one-way and produce no reply. STORE, RETRIEVE
     * and DELETE produce a RESPONSE frame; errors are reported in its status, never thrown.
     */
    class EnclaveService {
    public:
        explicit EnclaveService(Enclave& enclave);

        std::optional<Frame> handle(const Frame& frame);

    private:
        Response handle_request(const Frame& frame);

        Enclave& enclave_;
    };

} // namespace CruxEnclave

#endif // CRUXENCLAVE_SERVICE_HPP
