#pragma once
#include <string>

// 资产内容摘要（SHA-256，小写十六进制），用于版本记录的完整性校验
class Checksum {
public:
    static std::string sha256Hex(const std::string& data);

    // 分块读取文件计算摘要；文件无法读取时返回 false
    static bool sha256File(const std::string& path, std::string& hexDigest);

private:
    static std::string toHex(const unsigned char* digest, unsigned int length);
};
