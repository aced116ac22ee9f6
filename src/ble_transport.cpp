#include "ble_transport.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

// Bluetooth base UUID 00000000-0000-1000-8000-00805F9B34FB, little-endian
static const BleUuid BASE_UUID = {{
    0xFB, 0x34, 0x9B, 0x5F, 0x80, 0x00, 0x00, 0x80,
    0x00, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00
}};

// AD types
static const uint8_t AD_UUID16_INCOMPLETE  = 0x02;
static const uint8_t AD_UUID16_COMPLETE    = 0x03;
static const uint8_t AD_UUID128_INCOMPLETE = 0x06;
static const uint8_t AD_UUID128_COMPLETE   = 0x07;
static const uint8_t AD_NAME_SHORT         = 0x08;
static const uint8_t AD_NAME_COMPLETE      = 0x09;

BleUuid ble_uuid16(uint16_t short_uuid) {
    BleUuid uuid = BASE_UUID;
    uuid[12] = (uint8_t)(short_uuid & 0xFF);
    uuid[13] = (uint8_t)(short_uuid >> 8);
    return uuid;
}

BleUuid parse_ble_uuid(const std::string& text) {
    std::string hex;
    for (char c : text) {
        if (c == '-') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid UUID: " + text);
        }
        hex.push_back(c);
    }

    if (hex.size() == 4 || hex.size() == 8) {
        uint32_t value = std::stoul(hex, nullptr, 16);
        BleUuid uuid = BASE_UUID;
        uuid[12] = (uint8_t)(value & 0xFF);
        uuid[13] = (uint8_t)((value >> 8) & 0xFF);
        uuid[14] = (uint8_t)((value >> 16) & 0xFF);
        uuid[15] = (uint8_t)((value >> 24) & 0xFF);
        return uuid;
    }

    if (hex.size() != 32) {
        throw std::invalid_argument("Invalid UUID: " + text);
    }

    // Text form is big-endian
    BleUuid uuid{};
    for (int i = 0; i < 16; i++) {
        uuid[15 - i] = (uint8_t)std::stoul(hex.substr(i * 2, 2), nullptr, 16);
    }
    return uuid;
}

std::string format_ble_uuid(const BleUuid& uuid) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 15; i >= 0; i--) {
        oss << std::setw(2) << (int)uuid[i];
        if (i == 12 || i == 10 || i == 8 || i == 6) oss << '-';
    }
    return oss.str();
}

void parse_advertisement(const uint8_t* data, size_t len, Advertisement& adv) {
    size_t i = 0;
    while (i < len) {
        uint8_t field_len = data[i];
        if (field_len == 0) break;
        if (i + 1 + field_len > len) break;

        uint8_t type = data[i + 1];
        const uint8_t* value = data + i + 2;
        size_t value_len = field_len - 1;

        if (type == AD_NAME_COMPLETE || (type == AD_NAME_SHORT && adv.local_name.empty())) {
            adv.local_name.assign(reinterpret_cast<const char*>(value), value_len);
        } else if (type == AD_UUID16_INCOMPLETE || type == AD_UUID16_COMPLETE) {
            for (size_t k = 0; k + 1 < value_len; k += 2) {
                adv.service_uuids.push_back(ble_uuid16((uint16_t)(value[k] | (value[k + 1] << 8))));
            }
        } else if (type == AD_UUID128_INCOMPLETE || type == AD_UUID128_COMPLETE) {
            for (size_t k = 0; k + 15 < value_len; k += 16) {
                BleUuid uuid;
                std::copy_n(value + k, 16, uuid.begin());
                adv.service_uuids.push_back(uuid);
            }
        }

        i += 1 + field_len;
    }
}

bool matches_target(const Advertisement& adv, const BleTarget& target) {
    if (!target.name_prefixes.empty()) {
        bool name_ok = std::any_of(target.name_prefixes.begin(), target.name_prefixes.end(),
                                   [&](const std::string& prefix) {
                                       return adv.local_name.compare(0, prefix.size(), prefix) == 0;
                                   });
        if (!name_ok) return false;
    }

    if (!target.service_uuid.empty()) {
        BleUuid wanted = parse_ble_uuid(target.service_uuid);
        if (std::find(adv.service_uuids.begin(), adv.service_uuids.end(), wanted) ==
            adv.service_uuids.end()) {
            return false;
        }
    }

    return true;
}
