// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <span>
#include <cstring>
#include <stdexcept>
#include <algorithm>
#include <xcb/xcb.h>
#include <xcb/randr.h>
#include <spdlog/spdlog.h>
#include <smartdimd/x11-xcb.hpp>
#include <smartdimd/utils.hpp>

namespace smartdimd {
namespace xcb {

void throw_if(xcb_generic_error_t *err, std::string err_str) {
    if (err) {
        const int code = err->error_code;
        std::free(err);
        throw std::runtime_error(err_str + " " + std::to_string(code));
    }
}

connection::connection() : addr_(xcb_connect(nullptr, nullptr)) {
    if (const int err = xcb_connection_has_error(addr_); err > 0) {
        xcb_disconnect(addr_);
        throw std::runtime_error("xcb_connect failed with error " + std::to_string(err));
    }

    auto setup = xcb_get_setup(addr_);
    auto it    = xcb_setup_roots_iterator(setup);

    while (it.rem > 0) {
        screens_.emplace_back(it.data);
        xcb_screen_next(&it);
    }

    if (screens_.empty()) {
        xcb_disconnect(addr_);
        throw std::runtime_error("XCB: no screens found");
    }
}

connection::~connection() {
    xcb_disconnect(addr_);
}

xcb_connection_t* connection::get() const {
    return addr_;
}

xcb_screen_t* connection::first_screen() const {
    return screens_[0];
}

bool connection::extension_present(std::string name) const {
    auto query_c = xcb_query_extension(addr_, name.size(), name.c_str());
    auto query_r = c_unique_ptr<xcb_query_extension_reply_t>(xcb_query_extension_reply(addr_, query_c, nullptr));
    return query_r && query_r->present;
}

std::vector<randr::output> randr::outputs(const connection &conn, xcb_screen_t *screen) {
    if (!conn.extension_present("RANDR")) {
        spdlog::warn("[x11] RandR extension not available");
        return {};
    }

    xcb_generic_error_t *err = nullptr;

    auto res_c = xcb_randr_get_screen_resources_current(conn.get(), screen->root);
    auto res_r = c_unique_ptr<xcb_randr_get_screen_resources_current_reply_t> (xcb_randr_get_screen_resources_current_reply(conn.get(), res_c, &err));
    throw_if(err, "xcb_randr_get_screen_resources_current");

    const std::span outputs(xcb_randr_get_screen_resources_current_outputs(res_r.get()), res_r->num_outputs);
    std::vector<output> ret;

    for (const xcb_randr_output_t out : outputs) {
        auto output_c = xcb_randr_get_output_info(conn.get(), out, XCB_CURRENT_TIME);
        auto output_r = c_unique_ptr<xcb_randr_get_output_info_reply_t>(xcb_randr_get_output_info_reply(conn.get(), output_c, &err));
        throw_if(err, "xcb_randr_get_output_info");

        // disconnected outputs have no crtc
        if (output_r->crtc == XCB_NONE)
            continue;

        const uint8_t *buf = xcb_randr_get_output_info_name(output_r.get());
        const std::string dsp_id(buf, buf + output_r->name_len);

        auto gamma_c = xcb_randr_get_crtc_gamma_size(conn.get(), output_r->crtc);
        auto gamma_r = c_unique_ptr<xcb_randr_get_crtc_gamma_size_reply_t>(xcb_randr_get_crtc_gamma_size_reply(conn.get(), gamma_c, &err));
        throw_if(err, "xcb_randr_get_crtc_gamma_size");

        spdlog::info("[x11] found: {}, gamma ramp size: {}", dsp_id, gamma_r->size);

        ret.push_back({
                          dsp_id,
                          output_r->crtc,
                          gamma_r->size,
                      });
    }

    return ret;
}

std::vector<uint16_t> randr::get_gamma(const connection &conn, xcb_randr_crtc_t crtc) {
    xcb_generic_error_t *err = nullptr;
    auto gamma_c = xcb_randr_get_crtc_gamma(conn.get(), crtc);
    auto gamma_r = c_unique_ptr<xcb_randr_get_crtc_gamma_reply_t>(xcb_randr_get_crtc_gamma_reply(conn.get(), gamma_c, &err));
    throw_if(err, "xcb_randr_get_crtc_gamma");

    const size_t sz = gamma_r->size;
    std::vector<uint16_t> ramps(sz * 3);
    std::copy_n(xcb_randr_get_crtc_gamma_red(gamma_r.get()), sz, ramps.begin());
    std::copy_n(xcb_randr_get_crtc_gamma_green(gamma_r.get()), sz, ramps.begin() + sz);
    std::copy_n(xcb_randr_get_crtc_gamma_blue(gamma_r.get()), sz, ramps.begin() + 2 * sz);
    return ramps;
}

void randr::set_gamma(const connection &conn, xcb_randr_crtc_t crtc, const std::vector<uint16_t> &ramps) {
    const size_t sz = ramps.size() / 3;
    if (sz == 0)
        return;
    auto req = xcb_randr_set_crtc_gamma_checked(conn.get(), crtc, sz,
                                                &ramps[0 * sz],
                                                &ramps[1 * sz],
                                                &ramps[2 * sz]);
    throw_if(xcb_request_check(conn.get(), req), "xcb_randr_set_crtc_gamma_checked");
}

} // namespace xcb
} // namespace smartdimd
