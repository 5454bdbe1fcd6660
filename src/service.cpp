#include "cruxenclave/service.hpp"

#include "cruxenclave/errors.hpp"
#include "cruxenclave/logger.hpp"

namespace CruxEnclave {

// --- Response ---

Frame Response::to_frame() const {
    ByteWriter writer;
    writer.add_u32(request_id);
    writer.add_u8(static_cast<uint8_t>(status));
    writer.add_bytes(result);

    Frame frame;
    frame.op_code = OpCodes::RESPONSE;
    frame.body = writer.take();
    return frame;
}

Response Response::from_frame(const Frame& frame) {
    if (frame.op_code != OpCodes::RESPONSE) {
        throw CodecError("Frame is not a response.");
    }
    ByteReader reader(frame.body);
    Response response;
    response.request_id = reader.read_u32();
    uint8_t status = reader.read_u8();
    if (status > static_cast<uint8_t>(Status::InternalError)) {
        throw CodecError("Unknown response status.");
    }
    response.status = static_cast<Status>(status);
    response.result = reader.read_bytes();
    return response;
}

// --- Requests ---

namespace Requests {

    Frame store(uint32_t request_id, const byte_vector& message, const std::string& sender,
                const std::vector<std::string>& recipients) {
        ByteWriter writer;
        writer.add_u32(request_id);
        writer.add_bytes(message);
        writer.add_bytes(sender);
        writer.add_u64(static_cast<uint64_t>(recipients.size()));
        for (const auto& recipient : recipients) {
            writer.add_bytes(recipient);
        }

        Frame frame;
        frame.op_code = OpCodes::STORE;
        frame.body = writer.take();
        return frame;
    }

    static Frame digest_request(Frame::OpCode op_code, uint32_t request_id, const Digest& digest) {
        ByteWriter writer;
        writer.add_u32(request_id);
        writer.add_bytes(digest.data);

        Frame frame;
        frame.op_code = op_code;
        frame.body = writer.take();
        return frame;
    }

    Frame retrieve(uint32_t request_id, const Digest& digest) {
        return digest_request(OpCodes::RETRIEVE, request_id, digest);
    }

    Frame remove(uint32_t request_id, const Digest& digest) {
        return digest_request(OpCodes::DELETE, request_id, digest);
    }

} // namespace Requests

// --- EnclaveService ---

EnclaveService::EnclaveService(Enclave& enclave) : enclave_(enclave) {}

std::optional<Frame> EnclaveService::handle(const Frame& frame) {
    switch (frame.op_code) {
        case OpCodes::PUSH_PAYLOAD:
            try {
                enclave_.store_raw(frame.body);
            } catch (const std::exception& e) {
                LOG_WARN << "Rejected pushed payload, error=" << e.what();
            }
            return std::nullopt;

        case OpCodes::PARTY_INFO:
            enclave_.merge_directory(frame.body);
            return std::nullopt;

        case OpCodes::STORE:
        case OpCodes::RETRIEVE:
        case OpCodes::DELETE:
            return handle_request(frame).to_frame();

        default:
            LOG_WARN << "Ignoring frame with unknown op code, opCode=" << frame.op_code;
            return std::nullopt;
    }
}

static byte_vector error_text(const std::exception& e) {
    std::string text = e.what();
    return byte_vector(text.begin(), text.end());
}

Response EnclaveService::handle_request(const Frame& frame) {
    Response response;
    ByteReader reader(frame.body);

    try {
        response.request_id = reader.read_u32();
    } catch (const CodecError& e) {
        response.status = Status::BadRequest;
        response.result = error_text(e);
        return response;
    }

    try {
        if (frame.op_code == OpCodes::STORE) {
            byte_vector message = reader.read_bytes();
            std::string sender = reader.read_string();
            uint64_t count = reader.read_count(sizeof(uint64_t));
            std::vector<std::string> recipients;
            recipients.reserve(count);
            for (uint64_t i = 0; i < count; ++i) {
                recipients.push_back(reader.read_string());
            }
            response.result = enclave_.store(message, sender, recipients).data;
        } else {
            Digest digest{reader.read_bytes()};
            if (digest.data.size() != DIGEST_BYTES) {
                throw CodecError("Digest must be " + std::to_string(DIGEST_BYTES) + " bytes, got " +
                                 std::to_string(digest.data.size()));
            }
            if (frame.op_code == OpCodes::RETRIEVE) {
                response.result = enclave_.retrieve(digest);
            } else {
                enclave_.remove(digest);
            }
        }
    } catch (const CodecError& e) {
        response.status = Status::BadRequest;
        response.result = error_text(e);
    } catch (const UnknownSender& e) {
        response.status = Status::UnknownSender;
        response.result = error_text(e);
    } catch (const NotFound& e) {
        response.status = Status::NotFound;
        response.result = error_text(e);
    } catch (const UnsealError& e) {
        response.status = Status::UnsealError;
        response.result = error_text(e);
    } catch (const std::exception& e) {
        LOG_ERROR << "Request failed, opCode=" << frame.op_code << ", error=" << e.what();
        response.status = Status::InternalError;
        response.result = error_text(e);
    }
    return response;
}

} // namespace CruxEnclave
