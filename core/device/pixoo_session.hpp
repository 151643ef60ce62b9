#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "i_pixoo_session.hpp"

namespace pixoogate {
namespace device {

/**
 * @brief Live handle to one Pixoo panel
 *
 * Owns an RGB frame buffer (screen_size x screen_size, row-major) and the
 * animation counter used by Draw/SendHttpGif. Drawing only touches the
 * buffer; push() uploads it as a single frame.
 *
 * The device caches frames by PicID, so the counter is reset on the device
 * before the first push and again every kRefreshCounterLimit pushes.
 *
 * Thread safety: buffer and counter are guarded by mutex_. Concurrent draw and
 * push calls from different requests are safe but not ordered.
 */
class PixooSession : public IPixooSession {
public:
    static constexpr int kRefreshCounterLimit = 32;
    static constexpr int kFrameSpeedMs = 1000;

    PixooSession(std::string host, int screen_size, bool debug, IDeviceTransport &transport);

    const std::string &host() const override { return host_; }
    int screen_size() const override { return screen_size_; }

    void fill(const Rgb &color) override;
    void draw_pixel(int x, int y, const Rgb &color) override;
    void draw_line(int x0, int y0, int x1, int y1, const Rgb &color) override;
    void draw_rectangle(int x0, int y0, int x1, int y1, const Rgb &color, bool filled) override;

    TransportResult push() override;
    TransportResult set_brightness(int brightness) override;
    TransportResult set_channel(int channel) override;
    TransportResult set_clock(int clock_id) override;
    TransportResult set_face(int face_index) override;
    TransportResult set_visualizer(int position) override;
    TransportResult set_screen(bool on) override;
    TransportResult send_text(const PixooText &text) override;
    TransportResult send_command(const nlohmann::json &command) override;

    // Snapshot of the buffer (tests, diagnostics)
    std::vector<uint8_t> buffer() const;
    int counter() const;

private:
    // Caller holds mutex_
    void set_pixel_locked(int x, int y, const Rgb &color);

    // Sends the command and folds a non-zero error_code into DEVICE_ERROR
    TransportResult send(const nlohmann::json &payload);

    std::string host_;
    int screen_size_;
    bool debug_;
    IDeviceTransport &transport_;

    mutable std::mutex mutex_;
    std::vector<uint8_t> buffer_;
    int counter_ = 0;
    bool counter_synced_ = false;
};

}  // namespace device
}  // namespace pixoogate
