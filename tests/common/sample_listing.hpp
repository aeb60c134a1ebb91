#pragma once

namespace pcodex::test {

// Two-instruction x86 listing: MOV EAX,0x1 and PUSH EBP
inline constexpr const char* kSampleListing = R"(architecture: x86:LE:32:default
stack_pointer: ESP
datatypes:
  pointer_size: 4
  long_size: 4
registers:
  - {name: EAX, offset: 0x0, size: 4}
  - {name: AX, offset: 0x0, size: 2, base: EAX}
  - {name: AH, offset: 0x1, size: 1, base: AX}
  - {name: ESP, offset: 0x10, size: 4}
  - {name: EBP, offset: 0x14, size: 4}
functions:
  - name: main
    address: 0x401000
    blocks:
      - address: 0x401000
        instructions:
          - address: 0x401000
            assembly: MOV EAX,0x1
            pcode:
              - mnemonic: COPY
                output: {space: register, offset: 0x0, size: 4}
                inputs:
                  - {space: const, offset: 0x1, size: 4}
          - address: 0x401005
            assembly: PUSH EBP
            pcode:
              - mnemonic: COPY
                output: {space: unique, offset: 0xe80, size: 4}
                inputs:
                  - {space: register, offset: 0x14, size: 4}
              - mnemonic: INT_SUB
                output: {space: register, offset: 0x10, size: 4}
                inputs:
                  - {space: register, offset: 0x10, size: 4}
                  - {space: const, offset: 0x4, size: 4}
              - mnemonic: STORE
                inputs:
                  - {space: const, offset: 0x1b1, size: 8}
                  - {space: register, offset: 0x10, size: 4}
                  - {space: unique, offset: 0xe80, size: 4}
)";

}  // namespace pcodex::test
