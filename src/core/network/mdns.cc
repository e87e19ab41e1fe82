#include <algorithm>
#include <cctype>
#include <core/network/mdns.h>
#include <spdlog/spdlog.h>

namespace bridgefinder::core::mdns {

namespace {

constexpr std::size_t kHeaderSize = 12;
constexpr int kMaxPointerJumps = 16;
constexpr uint16_t kClassIn = 1;
constexpr uint16_t kUnicastResponseBit = 0x8000;

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool sameName(std::string_view a, std::string_view b) {
    auto trim = [](std::string_view s) {
        if (!s.empty() && s.back() == '.') {
            s.remove_suffix(1);
        }
        return s;
    };
    return lower(trim(a)) == lower(trim(b));
}

class Reader {
public:
    explicit Reader(std::span<const uint8_t> packet)
        : packet_(packet) {}

    bool ok() const { return ok_; }
    std::size_t offset() const { return offset_; }

    uint8_t u8() {
        if (!require(1)) {
            return 0;
        }
        return packet_[offset_++];
    }

    uint16_t u16() {
        if (!require(2)) {
            return 0;
        }
        uint16_t value = static_cast<uint16_t>(packet_[offset_] << 8 | packet_[offset_ + 1]);
        offset_ += 2;
        return value;
    }

    uint32_t u32() {
        uint32_t high = u16();
        uint32_t low = u16();
        return high << 16 | low;
    }

    void skip(std::size_t n) {
        if (require(n)) {
            offset_ += n;
        }
    }

    // Reads a possibly compressed domain name starting at the cursor.
    std::string name() {
        std::string result;
        std::size_t pos = offset_;
        bool jumped = false;
        int jumps = 0;

        while (ok_) {
            if (pos >= packet_.size()) {
                ok_ = false;
                break;
            }
            uint8_t len = packet_[pos];
            if (len == 0) {
                if (!jumped) {
                    offset_ = pos + 1;
                }
                break;
            }
            if ((len & 0xC0) == 0xC0) {
                if (pos + 1 >= packet_.size() || ++jumps > kMaxPointerJumps) {
                    ok_ = false;
                    break;
                }
                std::size_t target = static_cast<std::size_t>(len & 0x3F) << 8 | packet_[pos + 1];
                if (!jumped) {
                    offset_ = pos + 2;
                }
                jumped = true;
                pos = target;
                continue;
            }
            if ((len & 0xC0) != 0 || pos + 1 + len > packet_.size()) {
                ok_ = false;
                break;
            }
            if (!result.empty()) {
                result.push_back('.');
            }
            result.append(reinterpret_cast<const char*>(&packet_[pos + 1]), len);
            pos += 1 + len;
        }
        return result;
    }

private:
    bool require(std::size_t n) {
        if (!ok_ || offset_ + n > packet_.size()) {
            ok_ = false;
        }
        return ok_;
    }

    std::span<const uint8_t> packet_;
    std::size_t offset_ = 0;
    bool ok_ = true;
};

void putU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void putName(std::vector<uint8_t>& out, std::string_view name) {
    while (!name.empty()) {
        auto dot = name.find('.');
        auto label = name.substr(0, dot);
        if (!label.empty()) {
            auto len = std::min<std::size_t>(label.size(), 63);
            out.push_back(static_cast<uint8_t>(len));
            out.insert(out.end(), label.begin(), label.begin() + static_cast<std::ptrdiff_t>(len));
        }
        if (dot == std::string_view::npos) {
            break;
        }
        name.remove_prefix(dot + 1);
    }
    out.push_back(0);
}

std::optional<ResourceRecord> readRecord(Reader& reader, std::span<const uint8_t> packet) {
    ResourceRecord record;
    record.name = reader.name();
    record.type = reader.u16();
    reader.u16(); // class, cache-flush bit included
    record.ttl = reader.u32();
    uint16_t length = reader.u16();
    if (!reader.ok() || reader.offset() + length > packet.size()) {
        return std::nullopt;
    }
    const std::size_t end = reader.offset() + length;

    switch (record.type) {
    case kA:
        if (length == 4) {
            boost::asio::ip::address_v4::bytes_type bytes{};
            for (auto& b : bytes) {
                b = reader.u8();
            }
            record.address = boost::asio::ip::address_v4(bytes);
        }
        break;
    case kPtr:
        record.target = reader.name();
        break;
    case kSrv:
        reader.u16(); // priority
        reader.u16(); // weight
        record.port = reader.u16();
        record.target = reader.name();
        break;
    case kTxt: {
        while (reader.ok() && reader.offset() < end) {
            uint8_t len = reader.u8();
            if (reader.offset() + len > end) {
                return std::nullopt;
            }
            std::string entry;
            for (uint8_t i = 0; i < len; ++i) {
                entry.push_back(static_cast<char>(reader.u8()));
            }
            if (!entry.empty()) {
                record.text.push_back(std::move(entry));
            }
        }
        break;
    }
    default:
        break;
    }

    if (!reader.ok()) {
        return std::nullopt;
    }
    // Names inside rdata may be compressed, so the cursor can be anywhere up
    // to `end`; always resume right after the rdata.
    if (reader.offset() < end) {
        reader.skip(end - reader.offset());
    }
    return record;
}

} // namespace

std::string ServiceInstance::Label(std::string_view service) const {
    std::string label = instance_name;
    std::string suffix = "." + lower(service);
    if (label.size() > suffix.size() && lower(label).ends_with(suffix)) {
        label.resize(label.size() - suffix.size());
    }
    return label;
}

std::vector<uint8_t> BuildPtrQuery(std::string_view service, uint16_t id) {
    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + service.size() + 6);
    putU16(out, id);
    putU16(out, 0); // standard query
    putU16(out, 1); // qdcount
    putU16(out, 0);
    putU16(out, 0);
    putU16(out, 0);
    putName(out, service);
    putU16(out, kPtr);
    putU16(out, kClassIn | kUnicastResponseBit);
    return out;
}

std::optional<Message> Parse(std::span<const uint8_t> packet) {
    if (packet.size() < kHeaderSize) {
        return std::nullopt;
    }
    Reader reader(packet);
    Message message;
    message.id = reader.u16();
    message.flags = reader.u16();
    uint16_t questions = reader.u16();
    uint16_t answers = reader.u16();
    uint16_t authorities = reader.u16();
    uint16_t additionals = reader.u16();

    for (uint16_t i = 0; i < questions && reader.ok(); ++i) {
        reader.name();
        reader.skip(4);
    }
    if (!reader.ok()) {
        return std::nullopt;
    }

    const unsigned total = static_cast<unsigned>(answers) + authorities + additionals;
    for (unsigned i = 0; i < total; ++i) {
        auto record = readRecord(reader, packet);
        if (!record) {
            spdlog::debug("mdns: truncated record {}/{}", i + 1, total);
            return std::nullopt;
        }
        message.records.push_back(std::move(*record));
    }
    return message;
}

std::vector<ServiceInstance> ResolveInstances(const Message& message, std::string_view service) {
    std::vector<ServiceInstance> instances;

    for (const auto& ptr : message.records) {
        if (ptr.type != kPtr || !sameName(ptr.name, service)) {
            continue;
        }
        auto duplicate = std::any_of(instances.begin(), instances.end(), [&](const auto& known) {
            return sameName(known.instance_name, ptr.target);
        });
        if (duplicate) {
            continue;
        }

        ServiceInstance instance;
        instance.instance_name = ptr.target;

        for (const auto& record : message.records) {
            if (!sameName(record.name, ptr.target)) {
                continue;
            }
            if (record.type == kSrv) {
                instance.host = record.target;
                instance.port = record.port;
            } else if (record.type == kTxt) {
                for (const auto& entry : record.text) {
                    auto eq = entry.find('=');
                    if (eq == std::string::npos) {
                        instance.txt.emplace(lower(entry), std::string{});
                    } else {
                        instance.txt.emplace(lower(entry.substr(0, eq)), entry.substr(eq + 1));
                    }
                }
            }
        }

        if (!instance.host.empty()) {
            for (const auto& record : message.records) {
                if (record.type == kA && record.address && sameName(record.name, instance.host)) {
                    instance.address = record.address;
                    break;
                }
            }
        }
        instances.push_back(std::move(instance));
    }
    return instances;
}

} // namespace bridgefinder::core::mdns
