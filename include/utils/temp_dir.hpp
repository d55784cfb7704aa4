#ifndef TEMP_DIR_HPP
#define TEMP_DIR_HPP

#include <string>

// Unique directory created on construction, removed with its contents on destruction
class ScopedTempDir {
private:
    std::string dirPath;
    
public:
    ScopedTempDir(const std::string& root, const std::string& prefix);
    ~ScopedTempDir();
    
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;
    
    const std::string& path() const { return dirPath; }
    
    // Removes the directory now; later calls and the destructor do nothing
    void remove();
    
    // Stops tracking the directory without removing it
    std::string release();
};

#endif // TEMP_DIR_HPP
