#pragma once

#include <istream>
#include <memory>
#include <string>

#include "ndl-core/vcode.hh"

///
// Assembler: loads a textual listing into a linked image.
//
//  ; comment
//  .entry main 1               ; entry label and its argument count
//  .scope 0 "double"           ; needs-scope ID -> name
//  .constant 0 int 123         ; constants are numbered in order: int, text, symbol, foreign
//  main:
//      push_from_stack 0
//      return
//
// Mnemonics are the snake_case instruction names (see `vmx_mnemonic`).
// Errors are reported as `source:line: message` and throw `FatalError`.
//

namespace ndl {

    std::shared_ptr<VCode> assemble(std::istream& in, std::string const& source_name);
    std::shared_ptr<VCode> assemble_string(std::string const& source, std::string const& source_name = "<string>");
    std::shared_ptr<VCode> assemble_file(std::string const& file_path);

}   // namespace ndl
