#include "transport_bluez.hpp"
#include "errors.hpp"

#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
#include <bluetooth/l2cap.h>

#include <poll.h>
#include <strings.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <map>
#include <sstream>

// Fixed L2CAP channel carrying the attribute protocol on LE links
static const uint16_t ATT_CHANNEL_ID = 0x0004;

static const uint16_t MTU_DEFAULT   = 23;
static const uint16_t MTU_REQUESTED = 247;

// ATT PDU opcodes
static const uint8_t PDU_ERROR_RSP        = 0x01;
static const uint8_t PDU_MTU_REQ          = 0x02;
static const uint8_t PDU_MTU_RSP          = 0x03;
static const uint8_t PDU_READ_BY_TYPE_REQ = 0x08;
static const uint8_t PDU_READ_BY_TYPE_RSP = 0x09;
static const uint8_t PDU_WRITE_REQ        = 0x12;
static const uint8_t PDU_WRITE_RSP        = 0x13;
static const uint8_t PDU_INDICATE         = 0x1D;
static const uint8_t PDU_CONFIRM          = 0x1E;
static const uint8_t PDU_WRITE_CMD        = 0x52;

// GATT characteristic declaration type and property bits
static const uint16_t GATT_CHARACTERISTIC = 0x2803;
static const uint8_t PROP_WRITE_NO_RSP    = 0x04;
static const uint8_t PROP_WRITE           = 0x08;

// LE scan interval / window in 0.625 ms units
static const uint16_t SCAN_INTERVAL = 0x0010;
static const uint16_t SCAN_WINDOW   = 0x0010;

static bool is_disconnect_errno(int err) {
    return err == ENOTCONN || err == ECONNRESET || err == EPIPE ||
           err == ETIMEDOUT || err == EHOSTDOWN || err == ECONNABORTED;
}

BluezLink::BluezLink() {}

BluezLink::~BluezLink() {
    close();
}

// ==================== Discovery ====================

BluezLink::Candidate BluezLink::scan(const BleTarget& target) {
    int dev_id = hci_get_route(nullptr);
    if (dev_id < 0) {
        throw DeviceNotFound("No Bluetooth adapter available");
    }

    int dd = hci_open_dev(dev_id);
    if (dd < 0) {
        throw DeviceNotFound(std::string("Failed to open Bluetooth adapter: ") + strerror(errno));
    }

    // Active scan, so scan responses (which usually carry the name) are reported
    if (hci_le_set_scan_parameters(dd, 0x01, htobs(SCAN_INTERVAL), htobs(SCAN_WINDOW),
                                   LE_PUBLIC_ADDRESS, 0x00, 1000) < 0) {
        int err = errno;
        hci_close_dev(dd);
        throw DeviceNotFound(std::string("Failed to set scan parameters: ") + strerror(err));
    }

    if (hci_le_set_scan_enable(dd, 0x01, 0x00, 1000) < 0) {
        int err = errno;
        hci_close_dev(dd);
        throw DeviceNotFound(std::string("Failed to start scan: ") + strerror(err));
    }

    struct hci_filter old_filter;
    socklen_t old_len = sizeof(old_filter);
    struct hci_filter filter;
    hci_filter_clear(&filter);
    hci_filter_set_ptype(HCI_EVENT_PKT, &filter);
    hci_filter_set_event(EVT_LE_META_EVENT, &filter);

    if (getsockopt(dd, SOL_HCI, HCI_FILTER, &old_filter, &old_len) < 0 ||
        setsockopt(dd, SOL_HCI, HCI_FILTER, &filter, sizeof(filter)) < 0) {
        int err = errno;
        hci_le_set_scan_enable(dd, 0x00, 0x00, 1000);
        hci_close_dev(dd);
        throw DeviceNotFound(std::string("Failed to set HCI filter: ") + strerror(err));
    }

    // Advertising and scan response data arrive separately; merge per address
    std::map<std::string, Advertisement> seen;
    Candidate found;
    bool matched = false;

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(target.scan_timeout_ms);

    while (!matched) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) break;

        struct pollfd pfd = {dd, POLLIN, 0};
        int ready = poll(&pfd, 1, (int)remaining);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) break;

        unsigned char buf[HCI_MAX_EVENT_SIZE];
        ssize_t len = read(dd, buf, sizeof(buf));
        if (len < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (len < 1 + HCI_EVENT_HDR_SIZE + 2) continue;

        evt_le_meta_event* meta = (evt_le_meta_event*)(buf + 1 + HCI_EVENT_HDR_SIZE);
        if (meta->subevent != EVT_LE_ADVERTISING_REPORT) continue;

        uint8_t reports = meta->data[0];
        uint8_t* ptr = meta->data + 1;
        uint8_t* end = buf + len;

        for (int r = 0; r < reports && !matched; r++) {
            if (ptr + LE_ADVERTISING_INFO_SIZE > end) break;
            le_advertising_info* info = (le_advertising_info*)ptr;
            // Each report is followed by one RSSI byte
            if (ptr + LE_ADVERTISING_INFO_SIZE + info->length + 1 > end) break;

            char addr[18];
            ba2str(&info->bdaddr, addr);
            Advertisement& adv = seen[addr];
            parse_advertisement(info->data, info->length, adv);

            bool ok = target.address.empty()
                          ? matches_target(adv, target)
                          : strcasecmp(addr, target.address.c_str()) == 0;
            if (ok) {
                found.address = addr;
                found.address_type = info->bdaddr_type;
                found.name = adv.local_name;
                matched = true;
            }

            ptr += LE_ADVERTISING_INFO_SIZE + info->length + 1;
        }
    }

    setsockopt(dd, SOL_HCI, HCI_FILTER, &old_filter, sizeof(old_filter));
    hci_le_set_scan_enable(dd, 0x00, 0x00, 1000);
    hci_close_dev(dd);

    if (!matched) {
        std::ostringstream oss;
        oss << "No matching printer found (" << seen.size() << " devices seen)";
        throw DeviceNotFound(oss.str());
    }
    return found;
}

// ==================== ATT Channel ====================

void BluezLink::att_connect(const Candidate& device) {
    int sock = socket(PF_BLUETOOTH, SOCK_SEQPACKET, BTPROTO_L2CAP);
    if (sock < 0) {
        throw DeviceNotFound(std::string("Failed to create L2CAP socket: ") + strerror(errno));
    }

    // Zero address binds to any local adapter
    struct sockaddr_l2 local;
    memset(&local, 0, sizeof(local));
    local.l2_family = AF_BLUETOOTH;
    local.l2_cid = htobs(ATT_CHANNEL_ID);
    local.l2_bdaddr_type = BDADDR_LE_PUBLIC;

    if (bind(sock, (struct sockaddr*)&local, sizeof(local)) < 0) {
        int err = errno;
        ::close(sock);
        throw DeviceNotFound(std::string("Failed to bind L2CAP socket: ") + strerror(err));
    }

    struct bt_security sec;
    memset(&sec, 0, sizeof(sec));
    sec.level = BT_SECURITY_LOW;
    if (setsockopt(sock, SOL_BLUETOOTH, BT_SECURITY, &sec, sizeof(sec)) < 0) {
        int err = errno;
        ::close(sock);
        throw DeviceNotFound(std::string("Failed to set link security: ") + strerror(err));
    }

    struct sockaddr_l2 remote;
    memset(&remote, 0, sizeof(remote));
    remote.l2_family = AF_BLUETOOTH;
    remote.l2_cid = htobs(ATT_CHANNEL_ID);
    remote.l2_bdaddr_type = device.address_type == LE_RANDOM_ADDRESS ? BDADDR_LE_RANDOM
                                                                     : BDADDR_LE_PUBLIC;
    str2ba(device.address.c_str(), &remote.l2_bdaddr);

    if (connect(sock, (struct sockaddr*)&remote, sizeof(remote)) < 0) {
        int err = errno;
        ::close(sock);
        throw DeviceNotFound("Failed to connect to " + device.address + ": " + strerror(err));
    }

    sock_ = sock;
    mtu_ = MTU_DEFAULT;
}

void BluezLink::att_send(const std::vector<uint8_t>& pdu) {
    ssize_t sent = send(sock_, pdu.data(), pdu.size(), MSG_NOSIGNAL);
    if (sent < 0) {
        int err = errno;
        if (is_disconnect_errno(err)) {
            throw ConnectionLost(std::string("Printer disconnected: ") + strerror(err));
        }
        throw WriteFailed(std::string("ATT write failed: ") + strerror(err));
    }
    if ((size_t)sent != pdu.size()) {
        throw WriteFailed("ATT write truncated");
    }
}

std::vector<uint8_t> BluezLink::att_receive(int timeout_ms) {
    struct pollfd pfd = {sock_, POLLIN, 0};
    int ready;
    do {
        ready = poll(&pfd, 1, timeout_ms);
    } while (ready < 0 && errno == EINTR);

    if (ready < 0) {
        throw WriteFailed(std::string("ATT poll failed: ") + strerror(errno));
    }
    if (ready == 0) {
        throw WriteFailed("ATT response timeout");
    }
    if (pfd.revents & (POLLHUP | POLLERR)) {
        throw ConnectionLost("Printer disconnected");
    }

    uint8_t buf[512];
    ssize_t len = recv(sock_, buf, sizeof(buf), 0);
    if (len == 0) {
        throw ConnectionLost("Printer disconnected");
    }
    if (len < 0) {
        int err = errno;
        if (is_disconnect_errno(err)) {
            throw ConnectionLost(std::string("Printer disconnected: ") + strerror(err));
        }
        throw WriteFailed(std::string("ATT read failed: ") + strerror(err));
    }
    return std::vector<uint8_t>(buf, buf + len);
}

std::vector<uint8_t> BluezLink::att_request(const std::vector<uint8_t>& pdu,
                                            uint8_t response_opcode, int timeout_ms) {
    att_send(pdu);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            throw WriteFailed("ATT response timeout");
        }

        auto rsp = att_receive((int)remaining);
        if (rsp.empty()) continue;

        if (rsp[0] == response_opcode) {
            return rsp;
        }
        if (rsp[0] == PDU_ERROR_RSP && rsp.size() >= 5 && rsp[1] == pdu[0]) {
            return rsp;
        }
        if (rsp[0] == PDU_INDICATE) {
            att_send({PDU_CONFIRM});
        }
        // Notifications and unrelated PDUs are dropped
    }
}

// ==================== GATT ====================

void BluezLink::exchange_mtu() {
    auto rsp = att_request({PDU_MTU_REQ, (uint8_t)(MTU_REQUESTED & 0xFF), (uint8_t)(MTU_REQUESTED >> 8)},
                           PDU_MTU_RSP);
    if (rsp[0] != PDU_MTU_RSP || rsp.size() < 3) {
        mtu_ = MTU_DEFAULT;  // peer does not support the exchange
        return;
    }
    uint16_t server_mtu = rsp[1] | (rsp[2] << 8);
    mtu_ = std::max(MTU_DEFAULT, std::min(MTU_REQUESTED, server_mtu));
}

void BluezLink::discover_characteristic(const BleUuid& uuid) {
    int start = 0x0001;
    while (start <= 0xFFFF) {
        auto rsp = att_request({PDU_READ_BY_TYPE_REQ,
                                (uint8_t)(start & 0xFF), (uint8_t)(start >> 8),
                                0xFF, 0xFF,
                                (uint8_t)(GATT_CHARACTERISTIC & 0xFF), (uint8_t)(GATT_CHARACTERISTIC >> 8)},
                               PDU_READ_BY_TYPE_RSP);
        // Error response (attribute not found) ends the attribute table
        if (rsp[0] != PDU_READ_BY_TYPE_RSP || rsp.size() < 2) break;

        // handle(2) properties(1) value handle(2) uuid(2 or 16)
        size_t item = rsp[1];
        if (item != 7 && item != 21) break;

        int last = start - 1;
        for (size_t off = 2; off + item <= rsp.size(); off += item) {
            int decl_handle = rsp[off] | (rsp[off + 1] << 8);
            uint8_t props = rsp[off + 2];
            uint16_t value_handle = rsp[off + 3] | (rsp[off + 4] << 8);

            BleUuid chr_uuid;
            if (item == 7) {
                chr_uuid = ble_uuid16((uint16_t)(rsp[off + 5] | (rsp[off + 6] << 8)));
            } else {
                std::copy_n(rsp.begin() + off + 5, 16, chr_uuid.begin());
            }
            last = decl_handle;

            if (chr_uuid == uuid) {
                if (!(props & (PROP_WRITE_NO_RSP | PROP_WRITE))) {
                    throw DeviceNotFound("Characteristic " + format_ble_uuid(uuid) + " is not writable");
                }
                value_handle_ = value_handle;
                write_without_response_ = (props & PROP_WRITE_NO_RSP) != 0;
                return;
            }
        }

        if (last < start) break;
        start = last + 1;
    }

    throw DeviceNotFound("Characteristic " + format_ble_uuid(uuid) + " not found");
}

// ==================== BleLink ====================

void BluezLink::open(const BleTarget& target) {
    close();

    BleUuid chr_uuid = parse_ble_uuid(target.characteristic_uuid);
    if (!target.service_uuid.empty()) {
        parse_ble_uuid(target.service_uuid);
    }

    std::cout << "Scanning for printer..." << std::endl;
    Candidate device = scan(target);
    std::cout << "Found " << (device.name.empty() ? "printer" : device.name)
              << " (" << device.address << ")" << std::endl;

    att_connect(device);
    try {
        exchange_mtu();
        discover_characteristic(chr_uuid);
    } catch (const PrintError& e) {
        close();
        throw DeviceNotFound(std::string("Printer setup failed: ") + e.what());
    }

    std::cout << "Connected (MTU " << mtu_ << ", "
              << (write_without_response_ ? "write without response" : "write with response")
              << ")" << std::endl;
}

void BluezLink::close() {
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
    value_handle_ = 0;
    mtu_ = MTU_DEFAULT;
}

bool BluezLink::is_open() const {
    return sock_ >= 0;
}

size_t BluezLink::max_write_size() const {
    return mtu_ - 3;  // opcode + handle
}

void BluezLink::write(const std::vector<uint8_t>& chunk) {
    if (sock_ < 0) {
        throw ConnectionLost("Not connected to a printer");
    }
    if (chunk.size() > max_write_size()) {
        throw WriteFailed("Chunk of " + std::to_string(chunk.size()) +
                          " bytes exceeds the link limit of " + std::to_string(max_write_size()));
    }

    std::vector<uint8_t> pdu;
    pdu.reserve(chunk.size() + 3);
    pdu.push_back(write_without_response_ ? PDU_WRITE_CMD : PDU_WRITE_REQ);
    pdu.push_back((uint8_t)(value_handle_ & 0xFF));
    pdu.push_back((uint8_t)(value_handle_ >> 8));
    pdu.insert(pdu.end(), chunk.begin(), chunk.end());

    if (write_without_response_) {
        att_send(pdu);
        return;
    }

    auto rsp = att_request(pdu, PDU_WRITE_RSP);
    if (rsp[0] != PDU_WRITE_RSP) {
        std::ostringstream oss;
        oss << "Printer rejected write (ATT error 0x" << std::hex << (int)rsp[4] << ")";
        throw WriteFailed(oss.str());
    }
}

// Factory function for BlueZ backend
#ifdef CATPRINT_BACKEND_BLUEZ
std::unique_ptr<BleLink> create_ble_link() {
    return std::make_unique<BluezLink>();
}
#endif
