#ifndef MBR_GPT_HPP
#define MBR_GPT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace BootStructures {
    
    enum class TableType {
        MBR,
        GPT
    };
    
    TableType parseTableType(const std::string& name, bool* ok = nullptr);
    std::string getTableName(TableType type);
    
    const size_t BOOT_CODE_SIZE = 440;
    const uint16_t BOOT_SIGNATURE = 0xAA55;
    
    #pragma pack(push, 1)
    struct MBRPartitionEntry {
        uint8_t status;
        uint8_t firstCHS[3];
        uint8_t partitionType;
        uint8_t lastCHS[3];
        uint32_t firstLBA;
        uint32_t sectorCount;
    };
    
    struct MBR {
        uint8_t bootCode[BOOT_CODE_SIZE];
        uint32_t diskSignature;
        uint16_t reserved;
        MBRPartitionEntry partitions[4];
        uint16_t signature;
    };
    #pragma pack(pop)
    
    static_assert(sizeof(MBR) == 512, "MBR must be one sector");
    
    // Sector-0 editor. Works on block devices and on plain image files.
    class PartitionTable {
    private:
        std::string device;
        int deviceFd;
        
    public:
        explicit PartitionTable(const std::string& dev);
        ~PartitionTable();
        
        PartitionTable(const PartitionTable&) = delete;
        PartitionTable& operator=(const PartitionTable&) = delete;
        
        void open();
        MBR readMBR();
        bool hasBootSignature();
        bool isProtectiveMBR();
        void makeBootable(int partitionIndex = 0);
        void writeBootCode(const std::vector<uint8_t>& bootCode);
        bool commit();
        
    private:
        void writeMBR(const MBR& mbr);
    };
    
    // First BOOT_CODE_SIZE bytes of an installed mbr.bin
    std::vector<uint8_t> loadBootCode(const std::string& path);
    std::string findBootCode(const std::vector<std::string>& searchPaths);
}

#endif // MBR_GPT_HPP
