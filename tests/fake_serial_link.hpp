#ifndef FAKE_SERIAL_LINK_HPP
#define FAKE_SERIAL_LINK_HPP

#include <deque>
#include <stdexcept>
#include <string>
#include <vector>
#include "pump_errors.hpp"
#include "serial_link.hpp"

/**
 * @brief 按脚本应答的内存串口
 *
 * 每条写入的命令必须与脚本中下一条期望一致，随后把对应应答放入接收缓冲。
 * 运行完成通知有两种送达方式：
 *  - completeOnNextReply(): 附在下一条命令的应答之后（竞争情形）
 *  - completeWhenWaited(): 只在无超时的阻塞读取时送达（finishRunning）
 * replyLater() 模拟分批到达的数据：这些字节不计入 bytesAvailable()，
 * 只在读取遇到空缓冲时才送达。
 */
class FakeSerialLink : public SerialLink {
public:
    explicit FakeSerialLink(int timeout_ms = 1000) : timeout_ms_(timeout_ms) {}

    void expect(const std::string& command, const std::string& reply) {
        script_.push_back(Expectation{command, reply});
    }

    void feed(const std::string& bytes) { rx_ += bytes; }

    void completeOnNextReply(const std::string& bytes = "\nT*") { nextReplyTail_ += bytes; }

    void completeWhenWaited(const std::string& bytes = "\nT*") { waitDeliveries_.push_back(bytes); }

    void replyLater(const std::string& bytes) { lateChunks_.push_back(bytes); }

    void trackCloses(int* counter) { closeCounter_ = counter; }

    void write(const std::string& data) override {
        if (!open_) {
            throw ConnectivityError("write on closed fake link");
        }
        written_.push_back(data);
        if (data.empty() || data.back() != '\r') {
            throw std::runtime_error("command not terminated by CR: " + data);
        }
        std::string command = data.substr(0, data.size() - 1);
        if (script_.empty()) {
            throw std::runtime_error("unexpected command: " + command);
        }
        Expectation next = script_.front();
        script_.pop_front();
        if (next.command != command) {
            throw std::runtime_error("expected '" + next.command + "' but got '" + command + "'");
        }
        rx_ += next.reply;
        rx_ += nextReplyTail_;
        nextReplyTail_.clear();
    }

    bool readByte(char& c) override {
        if (!open_) {
            throw ConnectivityError("read on closed fake link");
        }
        if (rx_.empty() && !lateChunks_.empty()) {
            rx_ += lateChunks_.front();
            lateChunks_.pop_front();
        }
        if (rx_.empty() && timeout_ms_ == kWaitForever) {
            if (waitDeliveries_.empty()) {
                throw std::runtime_error("blocking read would never return");
            }
            rx_ += waitDeliveries_.front();
            waitDeliveries_.pop_front();
            ++blockingWaits_;
        }
        if (rx_.empty()) {
            return false;
        }
        c = rx_[0];
        rx_.erase(0, 1);
        return true;
    }

    bool readLine(std::string& line) override {
        line.clear();
        char c = 0;
        while (readByte(c)) {
            line.push_back(c);
            if (c == '\n') {
                return true;
            }
        }
        return false;
    }

    size_t bytesAvailable() override { return rx_.size(); }

    void setTimeout(int timeout_ms) override {
        timeout_ms_ = timeout_ms;
        timeoutHistory_.push_back(timeout_ms);
    }

    int timeout() const override { return timeout_ms_; }

    void close() override {
        if (open_) {
            open_ = false;
            if (closeCounter_) {
                ++(*closeCounter_);
            }
        }
    }

    bool isOpen() const override { return open_; }

    const std::vector<std::string>& written() const { return written_; }
    const std::vector<int>& timeoutHistory() const { return timeoutHistory_; }
    size_t pendingExpectations() const { return script_.size(); }
    size_t unreadBytes() const { return rx_.size(); }
    size_t lateChunksPending() const { return lateChunks_.size(); }
    int blockingWaits() const { return blockingWaits_; }

private:
    struct Expectation {
        std::string command;
        std::string reply;
    };

    std::deque<Expectation> script_;
    std::string rx_;
    std::string nextReplyTail_;
    std::deque<std::string> waitDeliveries_;
    std::deque<std::string> lateChunks_;
    std::vector<std::string> written_;
    std::vector<int> timeoutHistory_;
    int timeout_ms_;
    int blockingWaits_ = 0;
    bool open_ = true;
    int* closeCounter_ = nullptr;
};

/**
 * @brief 组装一条应答：空行 + 各应答行 + 提示符
 */
inline std::string reply(const std::vector<std::string>& lines = {}, const std::string& prompt = ":") {
    std::string bytes = "\n";
    for (const auto& line : lines) {
        bytes += line + "\r\n";
    }
    return bytes + prompt;
}

inline std::string reply(const std::string& line, const std::string& prompt = ":") {
    return reply(std::vector<std::string>{line}, prompt);
}

#endif // FAKE_SERIAL_LINK_HPP
