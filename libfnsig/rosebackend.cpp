// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <AsmUnparser_compat.h>

#include <cctype>

#include "rosebackend.hpp"
#include "misc.hpp"

namespace fnsig {

RoseBackend::RoseBackend(ProgOptVarMap const & vm,
                         std::vector<std::string> const & specimen_names)
  : engine(new P2::Engine()),
    partitioner(create_partitioner(vm, engine.get(), specimen_names))
{
  index();
}

void
RoseBackend::add_name(address_t addr, std::string const & name)
{
  auto old = names.find(addr);
  if (old != names.end()) {
    name_index.erase(old->second);
  }
  names[addr] = name;
  name_index[name] = addr;
}

// Name every function, note which function owns each instruction, and find the strings
// referenced from code.
void
RoseBackend::index()
{
  auto timer = make_timer();
  for (P2::Function::Ptr const & function : partitioner.functions()) {
    address_t entry = function->address();
    std::string name = function->name();
    if (name.empty()) {
      name = placeholder_name(entry);
    }
    if (name_index.count(name)) {
      GDEBUG << "Duplicate function name " << name << " at " << addr_str(entry) << LEND;
    } else {
      add_name(entry, name);
    }

    for (rose_addr_t bbva : function->basicBlockAddresses()) {
      P2::BasicBlock::Ptr bb = partitioner.basicBlockExists(bbva);
      if (!bb) {
        continue;
      }
      for (SgAsmInstruction * insn : bb->instructions()) {
        insn_function.emplace(insn->get_address(), entry);
        for (SgAsmExpression * expr : insn->get_operandList()->get_operands()) {
          auto target = data_address(expr);
          if (!target) {
            continue;
          }
          auto found = strs.find(*target);
          if (found == strs.end()) {
            std::string value = read_string(*target);
            if (value.empty()) {
              continue;
            }
            found = strs.emplace(*target, StringRecord()).first;
            found->second.address = *target;
            found->second.value = std::move(value);
          }
          found->second.xrefs.insert(insn->get_address());
        }
      }
    }
  }
  GINFO << "Found " << strs.size() << " strings referenced by " << names.size()
        << " functions in " << timer << " seconds." << LEND;
}

bool
RoseBackend::is_data(address_t addr) const
{
  return partitioner.memoryMap()->at(addr).require(MemoryMap::READABLE)
    .prohibit(MemoryMap::EXECUTABLE).exists();
}

// The address an operand refers to, for constants and direct memory references that land in
// mapped data.
boost::optional<address_t>
RoseBackend::data_address(SgAsmExpression * expr) const
{
  SgAsmValueExpression * value = isSgAsmValueExpression(expr);
  if (!value) {
    SgAsmMemoryReferenceExpression * mr = isSgAsmMemoryReferenceExpression(expr);
    if (mr) {
      SgAsmExpression * addr_expr = mr->get_address();
      value = isSgAsmValueExpression(addr_expr);
      // [reg+disp] and [reg*scale+disp]
      if (!value && isSgAsmBinaryExpression(addr_expr)) {
        value = isSgAsmValueExpression(isSgAsmBinaryExpression(addr_expr)->get_rhs());
      }
    }
  }
  if (!value) {
    return boost::none;
  }
  address_t addr = SageInterface::getAsmConstant(value);
  if (!is_data(addr)) {
    return boost::none;
  }
  return addr;
}

std::string
RoseBackend::read_string(address_t addr) const
{
  std::vector<std::uint8_t> buffer(FNSIG_ROSE_MAX_STRING_LENGTH);
  std::size_t nread = partitioner.memoryMap()->at(addr).limit(buffer.size())
                      .require(MemoryMap::READABLE).read(buffer.data()).size();
  std::string result;
  for (std::size_t i = 0; i < nread; ++i) {
    char c = static_cast<char>(buffer[i]);
    if (c == '\0') {
      if (result.size() < FNSIG_ROSE_MIN_STRING_LENGTH) {
        return std::string();
      }
      return result;
    }
    if (!std::isprint(static_cast<unsigned char>(c)) && c != '\t' && c != '\n' && c != '\r') {
      return std::string();
    }
    result.push_back(c);
  }
  // Unterminated
  return std::string();
}

InstructionInfo
RoseBackend::instruction(SgAsmInstruction * insn) const
{
  InstructionInfo info;
  info.address = insn->get_address();
  info.mnemonic = insn->get_mnemonic();
  SgAsmX86Instruction * xinsn = isSgAsmX86Instruction(insn);
  info.is_call = xinsn && xinsn->get_kind() == Rose::BinaryAnalysis::x86_call;

  bool complete;
  address_t fallthru = insn->get_address() + insn->get_size();
  for (rose_addr_t target : insn->architecture()->getSuccessors(insn, complete).values()) {
    if (target != fallthru) {
      info.code_refs.push_back(target);
    }
  }

  for (SgAsmExpression * expr : insn->get_operandList()->get_operands()) {
    std::string text = unparseExpression(expr, NULL, NULL);
    SgAsmIntegerValueExpression * ival = isSgAsmIntegerValueExpression(expr);
    if (ival) {
      info.operands.emplace_back(text, SageInterface::getAsmConstant(ival));
    } else {
      info.operands.emplace_back(text);
    }

    if (info.is_call || !info.code_refs.empty()) {
      // call [import] has no concrete successor, but the import slot usually has a name.
      if (info.is_call && info.code_refs.empty() && isSgAsmMemoryReferenceExpression(expr)) {
        auto slot = isSgAsmValueExpression(isSgAsmMemoryReferenceExpression(expr)->get_address());
        if (slot) {
          info.code_refs.push_back(SageInterface::getAsmConstant(slot));
        }
      }
      continue;
    }
    auto ref = data_address(expr);
    if (ref) {
      info.data_refs.push_back(*ref);
    }
  }
  return info;
}

std::vector<address_t>
RoseBackend::functions() const
{
  std::vector<address_t> result;
  for (P2::Function::Ptr const & function : partitioner.functions()) {
    // Imports have no code of their own.
    if (function->basicBlockAddresses().empty()) {
      continue;
    }
    result.push_back(function->address());
  }
  return result;
}

std::vector<BasicBlockInfo>
RoseBackend::basic_blocks(address_t function) const
{
  std::vector<BasicBlockInfo> result;
  P2::Function::Ptr func = partitioner.functionExists(function);
  if (!func) {
    return result;
  }
  // basicBlockAddresses() is ordered, so blocks are always returned in address order.
  for (rose_addr_t bbva : func->basicBlockAddresses()) {
    P2::BasicBlock::Ptr bb = partitioner.basicBlockExists(bbva);
    if (!bb) {
      GWARN << "Function " << addr_str(function) << " has no basic block at "
            << addr_str(bbva) << LEND;
      continue;
    }
    BasicBlockInfo info;
    info.address = bbva;
    for (SgAsmInstruction * insn : bb->instructions()) {
      info.instructions.push_back(instruction(insn));
    }
    result.push_back(std::move(info));
  }
  return result;
}

boost::optional<address_t>
RoseBackend::function_containing(address_t addr) const
{
  auto found = insn_function.find(addr);
  if (found == insn_function.end()) {
    return boost::none;
  }
  return found->second;
}

std::vector<StringRecord>
RoseBackend::strings() const
{
  std::vector<StringRecord> result;
  result.reserve(strs.size());
  for (auto const & s : strs) {
    result.push_back(s.second);
  }
  return result;
}

// Any mapped address is something the program defines, which is the closest we can get to a
// disassembler's notion of a defined location.
bool
RoseBackend::is_known_location(address_t addr) const
{
  if (names.count(addr) || strs.count(addr) || insn_function.count(addr)) {
    return true;
  }
  return partitioner.memoryMap()->at(addr).exists(0);
}

boost::optional<std::string>
RoseBackend::display_name(address_t addr) const
{
  auto found = names.find(addr);
  if (found == names.end()) {
    return boost::none;
  }
  return found->second;
}

boost::optional<address_t>
RoseBackend::address_of_name(std::string const & name) const
{
  auto found = name_index.find(name);
  if (found == name_index.end()) {
    return boost::none;
  }
  return found->second;
}

bool
RoseBackend::set_name(address_t addr, std::string const & name)
{
  auto existing = name_index.find(name);
  if (existing != name_index.end() && existing->second != addr) {
    return false;
  }
  add_name(addr, name);
  P2::Function::Ptr func = partitioner.functionExists(addr);
  if (func) {
    func->name(name);
  }
  return true;
}

void
RoseBackend::mark_library(address_t addr)
{
  library.insert(addr);
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
