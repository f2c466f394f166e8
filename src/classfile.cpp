#include "classforge/classfile.hpp"

#include <llvm/Support/Endian.h>

namespace classforge {

const Constant& ConstantPool::at(uint16_t index) const {
    if(index == 0 || index >= entries_.size()) throw format_error("constant pool index " + std::to_string(index) + " out of range");
    return entries_[index];
}

Constant& ConstantPool::at(uint16_t index) {
    if(index == 0 || index >= entries_.size()) throw format_error("constant pool index " + std::to_string(index) + " out of range");
    return entries_[index];
}

uint16_t ConstantPool::append(Constant c){
    int width = slot_width(c.kind());
    if(entries_.size() + width > 0xFFFF) throw format_error("constant pool overflow");
    auto index = static_cast<uint16_t>(entries_.size());
    entries_.push_back(std::move(c));
    if(width == 2) entries_.emplace_back();
    return index;
}

const std::string& ConstantPool::utf8(uint16_t index) const {
    const Constant& c = at(index);
    if(c.kind() != Tag::Utf8) throw format_error("constant " + std::to_string(index) + " is not Utf8");
    return c.bytes;
}

uint16_t ConstantPool::refIndex(uint16_t index) const {
    const Constant& c = at(index);
    if(c.kind() != Tag::Class && c.kind() != Tag::String && c.kind() != Tag::MethodType)
        throw format_error("constant " + std::to_string(index) + " does not reference a Utf8 entry");
    return unpack_u2(c.bytes);
}

const std::string& ConstantPool::className(uint16_t index) const {
    if(at(index).kind() != Tag::Class) throw format_error("constant " + std::to_string(index) + " is not a Class");
    return utf8(refIndex(index));
}

uint16_t ConstantPool::find(Tag tag, const std::string& bytes) const {
    for(size_t i = 1; i < entries_.size(); ++i){
        const Constant& c = entries_[i];
        if(c.tag == static_cast<uint8_t>(tag) && c.bytes == bytes) return static_cast<uint16_t>(i);
    }
    return 0;
}

std::string pack_u2(uint16_t v){
    char buf[2];
    llvm::support::endian::write16be(buf, v);
    return std::string(buf, 2);
}

uint16_t unpack_u2(const std::string& bytes, size_t offset){
    if(bytes.size() < offset + 2) throw format_error("truncated constant payload");
    return llvm::support::endian::read16be(bytes.data() + offset);
}

static void put_utf8(std::string& out, uint32_t cp){
    if(cp < 0x80){ out += static_cast<char>(cp); }
    else if(cp < 0x800){ out += static_cast<char>(0xC0 | (cp >> 6)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
    else if(cp < 0x10000){ out += static_cast<char>(0xE0 | (cp >> 12)); out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
    else { out += static_cast<char>(0xF0 | (cp >> 18)); out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F)); out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
}

static void put_modified(std::string& out, uint32_t unit){
    if(unit != 0 && unit < 0x80){ out += static_cast<char>(unit); }
    else if(unit < 0x800){ out += static_cast<char>(0xC0 | (unit >> 6)); out += static_cast<char>(0x80 | (unit & 0x3F)); }
    else { out += static_cast<char>(0xE0 | (unit >> 12)); out += static_cast<char>(0x80 | ((unit >> 6) & 0x3F)); out += static_cast<char>(0x80 | (unit & 0x3F)); }
}

std::string decode_modified_utf8(const std::string& in){
    std::string out; out.reserve(in.size());
    size_t i = 0;
    auto cont = [&](size_t at)->uint32_t{
        if(at >= in.size() || (static_cast<uint8_t>(in[at]) & 0xC0) != 0x80) throw format_error("malformed modified UTF-8");
        return static_cast<uint8_t>(in[at]) & 0x3F;
    };
    // Reads one 16-bit unit starting at i and advances i.
    auto unit = [&]()->uint32_t{
        uint8_t b = static_cast<uint8_t>(in[i]);
        if(b < 0x80){ if(b == 0) throw format_error("malformed modified UTF-8"); i += 1; return b; }
        if((b & 0xE0) == 0xC0){ uint32_t u = ((b & 0x1Fu) << 6) | cont(i + 1); i += 2; return u; }
        if((b & 0xF0) == 0xE0){ uint32_t u = ((b & 0x0Fu) << 12) | (cont(i + 1) << 6) | cont(i + 2); i += 3; return u; }
        throw format_error("malformed modified UTF-8");
    };
    while(i < in.size()){
        uint32_t u = unit();
        if(u >= 0xD800 && u <= 0xDBFF && i < in.size()){
            size_t save = i;
            uint32_t lo = unit();
            if(lo >= 0xDC00 && lo <= 0xDFFF){ put_utf8(out, 0x10000 + ((u - 0xD800) << 10) + (lo - 0xDC00)); continue; }
            i = save;
        }
        put_utf8(out, u);
    }
    return out;
}

std::string encode_modified_utf8(const std::string& in){
    std::string out; out.reserve(in.size());
    size_t i = 0;
    while(i < in.size()){
        uint8_t b = static_cast<uint8_t>(in[i]);
        uint32_t cp; size_t len;
        if(b < 0x80){ cp = b; len = 1; }
        else if((b & 0xE0) == 0xC0){ cp = b & 0x1Fu; len = 2; }
        else if((b & 0xF0) == 0xE0){ cp = b & 0x0Fu; len = 3; }
        else if((b & 0xF8) == 0xF0){ cp = b & 0x07u; len = 4; }
        else throw format_error("malformed UTF-8");
        if(i + len > in.size()) throw format_error("truncated UTF-8");
        for(size_t k = 1; k < len; ++k){
            uint8_t c = static_cast<uint8_t>(in[i + k]);
            if((c & 0xC0) != 0x80) throw format_error("malformed UTF-8");
            cp = (cp << 6) | (c & 0x3Fu);
        }
        i += len;
        if(cp >= 0x10000){
            cp -= 0x10000;
            put_modified(out, 0xD800 + (cp >> 10));
            put_modified(out, 0xDC00 + (cp & 0x3FF));
        } else {
            put_modified(out, cp);
        }
    }
    return out;
}

} // namespace classforge
