// Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at http://mozilla.org/MPL/2.0/.

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <udpkit/udpkit.hpp>
#include <udpkit/internal/logger.hpp>

class listener_sample : public udpkit::server_delegate,
        public std::enable_shared_from_this<listener_sample> {
public:
    listener_sample(const std::string &_name,
            const std::optional<std::string> &_interface, udpkit::port_t _port,
            const std::optional<std::vector<std::string>> &_multicast_groups,
            const std::vector<std::string> &_leave)
        : signals_(io_, SIGINT, SIGTERM),
          leave_timer_(io_),
          name_(_name),
          interface_(_interface),
          port_(_port),
          multicast_groups_(_multicast_groups),
          leave_(_leave),
          received_(0) {
    }

    bool init() {
        if (port_ != 0) {
            server_ = udpkit::runtime::get()->create_server(io_, interface_,
                    port_, multicast_groups_);
        } else {
            server_ = udpkit::runtime::get()->create_server(io_, name_);
        }

        if (!server_) {
            UDPKIT_ERROR << "Couldn't create server \"" << name_
                    << "\". Is it configured?";
            return false;
        }

        server_->set_delegate(shared_from_this());

        signals_.async_wait(
                std::bind(&listener_sample::on_signal, this,
                        std::placeholders::_1, std::placeholders::_2));
        return true;
    }

    bool start() {
        try {
            server_->start_listening();
        } catch (const udpkit::server_error &e) {
            UDPKIT_ERROR << "Starting failed: " << e.what();
            for (const auto &its_error : e.errors()) {
                try {
                    std::rethrow_exception(its_error);
                } catch (const std::exception &f) {
                    UDPKIT_ERROR << "  " << f.what();
                }
            }
            return false;
        } catch (const std::exception &e) {
            UDPKIT_ERROR << "Starting failed: " << e.what();
            return false;
        }

        if (!leave_.empty())
            schedule_leave();

        io_.run();
        return true;
    }

    void stop() {
        UDPKIT_INFO << "Stopping after " << received_ << " datagrams.";
        server_->print_status();
        server_->stop_listening();
        server_->set_delegate(nullptr);
        leave_timer_.cancel();
        io_.stop();
    }

    void on_started_listening(udpkit::server &_server) override {
        std::stringstream its_groups;
        for (const auto &g : _server.get_joined_multicast_groups())
            its_groups << " " << g;

        UDPKIT_INFO << "Server is listening on port " << _server.get_port()
                << (its_groups.str().empty() ? "" : ", joined:")
                << its_groups.str();
    }

    void on_stopped_listening(udpkit::server &_server,
            const boost::system::error_code &_error) override {
        UDPKIT_INFO << "Server stopped listening on port " << _server.get_port()
                << (_error ? " (" + _error.message() + ")" : "");
    }

    void on_message_received(udpkit::server &_server,
            const udpkit::byte_t *_data, udpkit::length_t _length,
            const std::optional<udpkit::endpoint_t> &_source) override {
        (void)_server;
        received_++;

        std::stringstream its_message;
        its_message << "Received a datagram from ";
        if (_source)
            its_message << *_source;
        else
            its_message << "<unknown>";
        its_message << " (" << std::dec << _length << ") ";
        for (udpkit::length_t i = 0; i < _length && i < 16; ++i)
            its_message << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(_data[i]) << " ";
        if (_length > 16)
            its_message << "...";
        UDPKIT_INFO << its_message.str();
    }

private:
    // A group can only be left once it is joined
    void schedule_leave() {
        leave_timer_.expires_after(std::chrono::milliseconds(100));
        leave_timer_.async_wait(
                std::bind(&listener_sample::on_leave_timer, this,
                        std::placeholders::_1));
    }

    void on_leave_timer(const boost::system::error_code &_error) {
        if (_error)
            return;

        const auto its_joined = server_->get_joined_multicast_groups();
        std::vector<std::string> its_pending;
        for (const auto &g : leave_) {
            if (!is_joined(its_joined, g)) {
                its_pending.push_back(g);
                continue;
            }

            UDPKIT_INFO << "Leaving " << g;
            try {
                server_->leave_multicast_group(g);
            } catch (const udpkit::server_error &e) {
                UDPKIT_ERROR << "Leaving " << g << " failed: " << e.what();
            }
        }
        leave_.swap(its_pending);

        if (!leave_.empty())
            schedule_leave();
    }

    static bool is_joined(const std::vector<std::string> &_joined,
            const std::string &_group) {
        boost::system::error_code ec;
        const auto its_group = boost::asio::ip::make_address(_group, ec);
        // Let the server report invalid groups
        if (ec)
            return true;
        for (const auto &j : _joined) {
            if (boost::asio::ip::make_address(j, ec) == its_group && !ec)
                return true;
        }
        return false;
    }

    void on_signal(const boost::system::error_code &_error, int _signal) {
        if (!_error) {
            UDPKIT_INFO << "Received signal " << _signal;
            stop();
        }
    }

private:
    boost::asio::io_context io_;
    boost::asio::signal_set signals_;
    boost::asio::steady_timer leave_timer_;

    std::string name_;
    std::optional<std::string> interface_;
    udpkit::port_t port_;
    std::optional<std::vector<std::string>> multicast_groups_;
    std::vector<std::string> leave_;

    std::shared_ptr<udpkit::server> server_;
    std::size_t received_;
};

static void print_usage(const char *_program) {
    std::cerr << "Usage: " << _program
            << " [--name <server>] [--port <port>] [--interface <name|address>]"
               " [--multicast <group>]... [--leave <group>]..."
            << std::endl;
}

int main(int argc, char **argv) {
    std::string its_name;
    std::optional<std::string> its_interface;
    udpkit::port_t its_port(0);
    std::optional<std::vector<std::string>> its_groups;
    std::vector<std::string> its_leave;

    const std::string name_option("--name");
    const std::string port_option("--port");
    const std::string interface_option("--interface");
    const std::string multicast_option("--multicast");
    const std::string leave_option("--leave");

    int i = 1;
    while (i < argc) {
        if (i + 1 >= argc) {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        if (name_option == argv[i]) {
            its_name = argv[i + 1];
        } else if (port_option == argv[i]) {
            unsigned long its_value(std::strtoul(argv[i + 1], nullptr, 10));
            if (its_value == 0 || its_value > 0xFFFF) {
                std::cerr << "Invalid port " << argv[i + 1] << std::endl;
                return EXIT_FAILURE;
            }
            its_port = static_cast<udpkit::port_t>(its_value);
        } else if (interface_option == argv[i]) {
            its_interface = argv[i + 1];
        } else if (multicast_option == argv[i]) {
            if (!its_groups)
                its_groups = std::vector<std::string>();
            its_groups->push_back(argv[i + 1]);
        } else if (leave_option == argv[i]) {
            its_leave.push_back(argv[i + 1]);
        } else {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        i += 2;
    }

    auto its_sample = std::make_shared<listener_sample>(its_name,
            its_interface, its_port, its_groups, its_leave);
    if (!its_sample->init())
        return EXIT_FAILURE;

    return (its_sample->start() ? EXIT_SUCCESS : EXIT_FAILURE);
}
