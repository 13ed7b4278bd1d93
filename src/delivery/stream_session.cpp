#include "stream_session.h"
#include "errors.h"
#include "util.h"

#include <iostream>

namespace agentrun {

StreamSession::StreamSession(EventRelay& relay, ConnectionRegistry& registry,
                             std::shared_ptr<Connection> connection, StreamWriter& writer,
                             Options options)
    : relay_(relay),
      registry_(registry),
      connection_(std::move(connection)),
      writer_(writer),
      options_(options) {}

void StreamSession::run(InboundLoop inbound) {
    const std::string& run_id = connection_->run_id();

    if (!writer_.open()) {
        std::cerr << "[Delivery] Client left before the stream opened on run " << run_id << std::endl;
        return;
    }

    Json::Value hello;
    hello["run_id"] = run_id;
    hello["connection_id"] = connection_->id();
    hello["transport"] = to_string(connection_->transport());
    hello["resume_from"] = format_cursor(connection_->delivered_cursor());
    hello["timestamp"] = now_timestamp();
    connection_->offer(OutboundEvent::notice("connected", hello));

    registry_.add(connection_);
    std::cout << "[Delivery] " << to_string(connection_->transport()) << " connection "
              << connection_->id() << " opened on run " << run_id
              << " (" << registry_.count(run_id) << " open)" << std::endl;

    {
        BackgroundTask pump_task("pump " + connection_->id(),
                                 [this](BackgroundTask& t) { pump(t); });
        BackgroundTask heartbeat_task("heartbeat " + connection_->id(),
                                      [this](BackgroundTask& t) { heartbeat(t); });
        std::unique_ptr<BackgroundTask> inbound_task;
        if (inbound) {
            inbound_task = std::make_unique<BackgroundTask>(
                "inbound " + connection_->id(),
                [this, inbound](BackgroundTask& t) { inbound(t, *connection_); });
        }

        write_loop();

        connection_->close();
        // Tasks cancel and join as they go out of scope
    }

    registry_.remove(connection_);
    bool overrun = connection_->overrun();
    writer_.close(overrun);

    std::cout << "[Delivery] Connection " << connection_->id() << " closed on run " << run_id
              << (overrun ? " (evicted)" : "")
              << ", delivered " << format_cursor(connection_->delivered_cursor()) << std::endl;
}

void StreamSession::pump(BackgroundTask& task) {
    const std::string& run_id = connection_->run_id();

    std::map<std::string, Channel> names;
    RelayCursor cursor;
    ChannelCursor start = connection_->queued_cursor();
    for (Channel channel : {Channel::OUTPUT, Channel::LOG, Channel::STATUS}) {
        std::string name = channel_name(run_id, channel);
        names[name] = channel;
        cursor[name] = start.count(channel) ? start[channel] : 0;
    }

    bool relay_down = false;
    while (!task.cancelled() && !connection_->closed()) {
        RelayBatch batch;
        try {
            batch = relay_.read(cursor, options_.relay_block, MAX_RELAY_READ_COUNT);
        } catch (const RelayUnavailable& e) {
            if (!relay_down) {
                std::cerr << "[Delivery] Relay read failed for run " << run_id << ": "
                          << e.what() << std::endl;
                relay_down = true;
            }
            task.sleep_for(options_.relay_retry);
            continue;
        }
        if (relay_down) {
            std::cout << "[Delivery] Relay reachable again for run " << run_id << std::endl;
            relay_down = false;
        }

        for (const auto& entry : batch) {
            auto name = names.find(entry.first);
            if (name == names.end()) continue;

            for (const RelayEntry& relay_entry : entry.second) {
                cursor[entry.first] = relay_entry.id;
                Event event = Event::from_fields(run_id, name->second, relay_entry.id,
                                                 relay_entry.fields);
                try {
                    if (!connection_->offer(OutboundEvent::from_event(event))) return;
                } catch (const ConnectionOverrun& e) {
                    std::cerr << "[Delivery] Evicted: " << e.what() << std::endl;
                    return;
                }

                if (event.type == "run_complete") {
                    connection_->close_after(options_.close_grace);
                }
            }
        }
    }
}

void StreamSession::heartbeat(BackgroundTask& task) {
    while (task.sleep_for(options_.heartbeat_interval)) {
        Json::Value data;
        data["timestamp"] = now_timestamp();
        try {
            if (!connection_->offer(OutboundEvent::notice("heartbeat", data))) return;
        } catch (const ConnectionOverrun& e) {
            std::cerr << "[Delivery] Evicted: " << e.what() << std::endl;
            return;
        }
    }
}

void StreamSession::write_loop() {
    OutboundEvent event;
    while (true) {
        if (!connection_->take(event, std::chrono::milliseconds(DELIVERY_POLL_MS))) {
            if (connection_->closed()) break;
            continue;
        }

        ChannelCursor cursor = connection_->delivered_cursor();
        if (event.resumable()) {
            cursor[*event.channel] = event.message_id;
        }
        if (!writer_.write(event, cursor)) {
            std::cout << "[Delivery] Client of connection " << connection_->id()
                      << " went away" << std::endl;
            break;
        }
        connection_->mark_delivered(event);
    }
}

} // namespace agentrun
