#pragma once

#include "ble_transport.hpp"
#include <cstdint>
#include <string>
#include <vector>

/// BlueZ transport: HCI LE scan for discovery, raw L2CAP ATT channel for GATT writes
class BluezLink : public BleLink {
public:
    BluezLink();
    ~BluezLink() override;

    void open(const BleTarget& target) override;
    void close() override;
    bool is_open() const override;
    size_t max_write_size() const override;
    void write(const std::vector<uint8_t>& chunk) override;

private:
    struct Candidate {
        std::string address;
        uint8_t address_type = 0;
        std::string name;
    };

    // HCI discovery
    Candidate scan(const BleTarget& target);

    // L2CAP ATT channel
    void att_connect(const Candidate& device);
    void att_send(const std::vector<uint8_t>& pdu);
    std::vector<uint8_t> att_receive(int timeout_ms);
    std::vector<uint8_t> att_request(const std::vector<uint8_t>& pdu, uint8_t response_opcode,
                                     int timeout_ms = 5000);

    // GATT procedures
    void exchange_mtu();
    void discover_characteristic(const BleUuid& uuid);

    int sock_ = -1;
    uint16_t mtu_ = 23;
    uint16_t value_handle_ = 0;
    bool write_without_response_ = true;
};
