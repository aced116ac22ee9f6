#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/// 128-bit UUID in over-the-air (little-endian) byte order
using BleUuid = std::array<uint8_t, 16>;

/// Expand a 16-bit UUID onto the Bluetooth base UUID
BleUuid ble_uuid16(uint16_t short_uuid);

/// Parse "ae01", "0000ae01" or "0000ae01-0000-1000-8000-00805f9b34fb".
/// Throws std::invalid_argument.
BleUuid parse_ble_uuid(const std::string& text);

/// Canonical lower-case 8-4-4-4-12 form
std::string format_ble_uuid(const BleUuid& uuid);

/// What to look for when discovering a printer
struct BleTarget {
    std::vector<std::string> name_prefixes = {"GB0", "MX", "YT"};
    std::string service_uuid = "ae30";        // empty: no service filter
    std::string characteristic_uuid = "ae01";
    std::string address;                      // pins one device, empty: first match
    int scan_timeout_ms = 10000;
};

/// Fields of interest from advertising and scan response data
struct Advertisement {
    std::string local_name;
    std::vector<BleUuid> service_uuids;
};

/// Merge the AD structures in `data` into `adv`. Malformed trailing bytes are ignored.
void parse_advertisement(const uint8_t* data, size_t len, Advertisement& adv);

/// Whether the name and service filters of `target` accept `adv`
bool matches_target(const Advertisement& adv, const BleTarget& target);

/// Abstract link to the printer's writable characteristic
class BleLink {
public:
    virtual ~BleLink() = default;

    /// Discover a matching printer, connect and resolve the write characteristic.
    /// Throws DeviceNotFound.
    virtual void open(const BleTarget& target) = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;

    /// Largest payload a single write may carry
    virtual size_t max_write_size() const = 0;

    /// Write one chunk, no acknowledgement payload is read back.
    /// Throws ConnectionLost if the peer is gone, WriteFailed otherwise.
    virtual void write(const std::vector<uint8_t>& chunk) = 0;
};

/// Create the default link backend (selected at build time)
std::unique_ptr<BleLink> create_ble_link();
