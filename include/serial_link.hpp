#ifndef SERIAL_LINK_HPP
#define SERIAL_LINK_HPP

#include <cstddef>
#include <string>

/**
 * @brief 串口字节流接口，驱动独占一个实例
 */
class SerialLink {
public:
    /// 不限时等待
    static const int kWaitForever = -1;

    virtual ~SerialLink() = default;

    /**
     * @brief 写入全部字节
     * @throws ConnectivityError 写入失败
     */
    virtual void write(const std::string& data) = 0;

    /**
     * @brief 读取一个字节
     * @param c 读到的字节
     * @return 超时返回 false
     */
    virtual bool readByte(char& c) = 0;

    /**
     * @brief 读取一行（包含结尾的 '\n'）
     * @param line 读到的内容，超时时为已读部分
     * @return 超时前未读到 '\n' 返回 false
     */
    virtual bool readLine(std::string& line) = 0;

    /**
     * @brief 当前可读、尚未消费的字节数
     */
    virtual size_t bytesAvailable() = 0;

    /**
     * @brief 设置读超时
     * @param timeout_ms 毫秒，kWaitForever 表示一直阻塞
     */
    virtual void setTimeout(int timeout_ms) = 0;

    virtual int timeout() const = 0;

    /**
     * @brief 关闭串口，重复调用无副作用
     */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
};

#endif // SERIAL_LINK_HPP
