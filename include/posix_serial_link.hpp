#ifndef POSIX_SERIAL_LINK_HPP
#define POSIX_SERIAL_LINK_HPP

#include <string>
#include "serial_link.hpp"

/**
 * @brief 基于 termios 的串口实现（8N1，原始模式）
 */
class PosixSerialLink : public SerialLink {
public:
    /**
     * @brief 打开并配置串口
     * @param device 设备路径，例如 /dev/ttyACM0
     * @param baud 波特率
     * @param timeout_ms 读超时
     * @throws ConnectivityError 打开或配置失败
     */
    PosixSerialLink(const std::string& device, int baud, int timeout_ms);

    ~PosixSerialLink() override;

    PosixSerialLink(const PosixSerialLink&) = delete;
    PosixSerialLink& operator=(const PosixSerialLink&) = delete;

    void write(const std::string& data) override;
    bool readByte(char& c) override;
    bool readLine(std::string& line) override;
    size_t bytesAvailable() override;
    void setTimeout(int timeout_ms) override;
    int timeout() const override;
    void close() override;
    bool isOpen() const override;

    /**
     * @brief 波特率是否在 termios 速率表中
     */
    static bool isSupportedBaud(int baud);

private:
    std::string device_;
    int fd_ = -1;
    int timeout_ms_;

    /**
     * @brief 等待可读
     * @param wait_ms 毫秒，负数表示一直等待
     * @return 超时返回 false
     */
    bool waitReadable(int wait_ms);
};

#endif // POSIX_SERIAL_LINK_HPP
